#pragma once

#include <string_view>

#include "infragraph/v1.hpp"

namespace infragraph::model {

using v1::ChangeSetStatus;
using v1::EditSessionStatus;

constexpr bool IsTerminal(ChangeSetStatus status) {
  return status == v1::CHANGE_SET_STATUS_APPLIED || status == v1::CHANGE_SET_STATUS_ABANDONED;
}

constexpr bool IsTerminal(EditSessionStatus status) {
  return status == v1::EDIT_SESSION_STATUS_SAVED || status == v1::EDIT_SESSION_STATUS_CANCELED;
}

// Open -> Applied | Abandoned. Terminal states never move.
constexpr bool CanTransition(ChangeSetStatus from, ChangeSetStatus to) {
  return from == v1::CHANGE_SET_STATUS_OPEN && IsTerminal(to);
}

// Open -> Saved | Canceled. Terminal states never move.
constexpr bool CanTransition(EditSessionStatus from, EditSessionStatus to) {
  return from == v1::EDIT_SESSION_STATUS_OPEN && IsTerminal(to);
}

constexpr std::string_view ToString(ChangeSetStatus status) {
  switch (status) {
    case v1::CHANGE_SET_STATUS_OPEN:
      return "open";
    case v1::CHANGE_SET_STATUS_APPLIED:
      return "applied";
    case v1::CHANGE_SET_STATUS_ABANDONED:
      return "abandoned";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(EditSessionStatus status) {
  switch (status) {
    case v1::EDIT_SESSION_STATUS_OPEN:
      return "open";
    case v1::EDIT_SESSION_STATUS_SAVED:
      return "saved";
    case v1::EDIT_SESSION_STATUS_CANCELED:
      return "canceled";
    default:
      return "unspecified";
  }
}

}  // namespace infragraph::model

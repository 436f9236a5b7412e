#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/core/unit_of_work.hpp"
#include "internal/model/tier.hpp"

namespace infragraph::core {

/*
  Row movement between tiers, inside the caller's unit of work.

  PromoteTier copies every row of `from` onto `to` (create-or-replace) and
  then deletes the `from` rows. When `to` is Head a tombstone deletes the
  Head row instead of being copied. Returns the number of rows moved.

  DiscardTier deletes every row of `tier` and returns how many it removed.
*/
std::size_t PromoteTier(UnitOfWork& uow, const model::TierKey& from, const model::TierKey& to);
std::size_t DiscardTier(UnitOfWork& uow, const model::TierKey& tier);

// Cancels every Open edit session under the change set, discarding drafts.
std::size_t CancelOpenSessions(UnitOfWork& uow, const std::string& change_set_id, std::uint64_t now_ms);

} // namespace infragraph::core

#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/observability/observe.hpp"

namespace infragraph::core {

/*
  Translation from portable DB codes to the util:: error taxonomy.

    NotFound                          -> util::NotFound
    AlreadyExists                     -> util::AlreadyExists
    Conflict / SerializationFailure /
    Busy                              -> util::Conflict
    everything else                   -> util::PersistenceError
*/

void ThrowIfDbError(const db::Result& result, const std::string& context);

[[noreturn]] void RethrowDbError(const db::DbError& error, const std::string& context);

template <typename Fn>
auto TranslateDbErrors(std::string_view context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    RethrowDbError(e, std::string(context));
  }
}

// Public entry points: observed (span, metrics, error log) and translated.
template <typename Fn>
auto Observed(std::string_view operation, std::string_view subject_id, Fn&& fn) {
  return observability::ObserveOperation(operation, subject_id, [&] { return TranslateDbErrors(operation, fn); });
}

} // namespace infragraph::core

#include "internal/core/db_errors.hpp"

#include "internal/util/errors.hpp"

namespace infragraph::core {

namespace {

[[noreturn]] void Throw(db::ErrorCode code, const std::string& message) {
  switch (code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw util::PersistenceError(message);
  }
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  Throw(result.code, result.message.empty() ? context : context + ": " + result.message);
}

void RethrowDbError(const db::DbError& error, const std::string& context) {
  Throw(error.code(), context + ": " + error.what() + " (" + db::ToString(error.code()) + ")");
}

} // namespace infragraph::core

#pragma once

#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/result.hpp"

namespace infragraph::db::postgres {

// pqxx exception -> portable code. Order matters: most derived first.
inline ErrorCode CodeOf(const pqxx::failure& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return ErrorCode::Conflict;
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return ErrorCode::AlreadyExists;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

inline DbError ToDbError(const pqxx::failure& e, const std::string& what) {
  return DbError(CodeOf(e), what + ": " + e.what());
}

} // namespace infragraph::db::postgres

#include "internal/core/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace issueflow::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (db::IsTransient(result.code)) {
    throw util::StoreUnavailable(message);
  }

  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace issueflow::core

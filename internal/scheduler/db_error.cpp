#include "internal/scheduler/db_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowsched::scheduler {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::InvalidState(message);
    case db::ErrorCode::Unsupported:
      throw util::Unsupported(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace flowsched::scheduler

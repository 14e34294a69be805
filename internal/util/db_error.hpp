#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace alo::util {

// Repository results to the caller-facing exception types.
inline void ThrowIfDbError(const alo::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case alo::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case alo::db::ErrorCode::NotFound:
      throw NotFound(message);
    case alo::db::ErrorCode::Conflict:
    case alo::db::ErrorCode::SerializationFailure:
      throw Conflict(message);
    default:
      throw std::runtime_error(message + " [" + std::string(alo::db::ErrorCodeName(result.code)) + "]");
  }
}

} // namespace alo::util

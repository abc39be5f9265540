#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::db {

// Lifts a repository Result into the util error hierarchy. Backend
// failures without a domain meaning stay std::runtime_error.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    case ErrorCode::ResourceExhausted:
      throw util::AllocatorExhausted(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace launchpad::db

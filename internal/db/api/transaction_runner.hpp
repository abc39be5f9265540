#pragma once

#include <cstdint>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::db {

/*
  Runs fn(tx) in a fresh transaction and commits it.

  A util::TransactionConflict (from fn or from Commit) discards the
  attempt and starts over with a new snapshot. A conflict means some
  other transaction committed, so with max_attempts == 0 the loop runs
  until this one commits; otherwise the conflict of the last attempt is
  rethrown. Any other exception rolls the transaction back through its
  destructor and propagates.
*/
template <typename Fn>
auto RunInTransaction(Repository& repository, uint32_t max_attempts, std::string_view operation, Fn&& fn) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict&) {
      if (max_attempts != 0 && attempt >= max_attempts) throw;
      LAUNCHPAD_LOG_DEBUG("transaction conflict, retrying", {observability::StringField("operation", std::string(operation)),
                                                             observability::IntField("attempt", attempt)});
      std::this_thread::yield();
    }
  }
}

} // namespace launchpad::db

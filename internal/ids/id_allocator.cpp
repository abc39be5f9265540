#include "id_allocator.hpp"

#include <thread>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::ids {

IdAllocator::IdAllocator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

int64_t IdAllocator::Next(db::Transaction& tx, const std::string& counter, int64_t quantity) {
  int64_t first_id = 0;
  db::ThrowIfDbError(repository_->NextId(tx, counter, quantity, first_id), "allocate " + counter);
  return first_id;
}

int64_t IdAllocator::Next(const std::string& counter, int64_t quantity) {
  // Each conflict means another allocation committed, so this always
  // makes progress.
  for (;;) {
    try {
      auto       tx       = repository_->Begin();
      const auto first_id = Next(*tx, counter, quantity);
      tx->Commit();
      return first_id;
    } catch (const util::TransactionConflict&) {
      LAUNCHPAD_LOG_DEBUG("id allocation conflict, retrying", {observability::StringField("counter", counter)});
      std::this_thread::yield();
    }
  }
}

void IdAllocator::Reset(db::Transaction& tx) {
  db::ThrowIfDbError(repository_->ResetCounters(tx), "reset counters");
  for (const char* counter : {kFireworkCounter, kLaunchCounter, kWorkflowCounter}) {
    // Touch so the standard counters exist, then rewind.
    int64_t ignored = 0;
    db::ThrowIfDbError(repository_->NextId(tx, counter, 1, ignored), "initialize " + std::string(counter));
  }
  db::ThrowIfDbError(repository_->ResetCounters(tx), "reset counters");
}

} // namespace launchpad::ids

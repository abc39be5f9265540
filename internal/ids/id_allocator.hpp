#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace launchpad::ids {

// Counter names in the meta table.
inline constexpr char kFireworkCounter[] = "next_node_id";
inline constexpr char kLaunchCounter[]   = "next_launch_id";
inline constexpr char kWorkflowCounter[] = "next_graph_id";

/*
  IdAllocator

  Hands out contiguous id ranges [first, first + quantity) per counter.
  Every counter starts at 1. Overflow fails closed with
  util::AllocatorExhausted instead of wrapping.
*/
class IdAllocator {
 public:
  explicit IdAllocator(std::shared_ptr<db::Repository> repository);

  // Inside the caller's transaction; the range is only owned once that
  // transaction commits.
  int64_t Next(db::Transaction& tx, const std::string& counter, int64_t quantity = 1);

  // Standalone reservation in its own transaction, retried on conflict.
  int64_t Next(const std::string& counter, int64_t quantity = 1);

  // All counters back to 1. Only valid on an otherwise empty store.
  void Reset(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace launchpad::ids

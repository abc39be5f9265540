#pragma once

namespace launchpad::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE under the connection's writer lock
  Memory: snapshot copy-on-write, optimistic commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically; throws util::TransactionConflict when an
  // optimistic backend detects a concurrent commit
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}

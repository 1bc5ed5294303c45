#pragma once

namespace issueflow::db {

/*
  One unit of work against the issue store, obtained from Repository::Begin().

  Every flow operation (claim-next, close-safe, block-with-context) runs its
  reads and its compare-and-set in a single Transaction, so the ready scan and
  the status change see the same store.

  All backends:
  - nothing is visible to other transactions until Commit()
  - destroying an uncommitted transaction rolls it back
  - Commit() throws util::Conflict when a row this transaction wrote was
    committed by someone else first, and util::StoreUnavailable when the
    store is busy or unreachable

  Write serialisation:
    SQLite    BEGIN IMMEDIATE; the connection holds the write lock throughout
    Postgres  READ COMMITTED; status changes are row-level compare-and-set,
              edge inserts take Repository::LockDependencyGraph()
    Memory    snapshot at Begin(), first committer wins on written rows
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // Safe to call again after Commit() or Rollback().
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace issueflow::db

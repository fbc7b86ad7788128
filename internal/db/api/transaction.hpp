#pragma once

namespace relaynorm::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - One document = one transaction

  SQLite: BEGIN IMMEDIATE, serialized on the shared handle
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy, serialized
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

} // namespace relaynorm::db

#pragma once

namespace eventlog::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Appended events are invisible to other readers until Commit()
  - Notifications queued inside the transaction are delivered on Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}

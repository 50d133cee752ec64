#pragma once

namespace datagraph::db {

/*
  One unit of work against a Repository. Every entity store, relationship
  store and ontology operation runs in exactly one.

  Writes become visible to other transactions only at Commit(). A transaction
  destroyed without Commit() rolls back, so an exception thrown mid-operation
  leaves the graph unchanged. Concurrent writers either wait for the lock
  (SQLite, Postgres) or fail at Commit() with util::Conflict (memory).
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace datagraph::db

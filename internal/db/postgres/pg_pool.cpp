#include "pg_pool.hpp"

namespace datagraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_relationship",
               "SELECT relationship_id, source_id, target_id, relationship_type, properties::text, created_at_ms, updated_at_ms, sequence "
               "FROM entity_relationships WHERE relationship_id=$1");

  conn.prepare("insert_relationship",
               "INSERT INTO entity_relationships(relationship_id,source_id,target_id,relationship_type,properties,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7)");

  conn.prepare("update_relationship",
               "UPDATE entity_relationships SET relationship_type=$2,properties=$3::jsonb,updated_at_ms=$4 WHERE relationship_id=$1");

  conn.prepare("delete_relationship", "DELETE FROM entity_relationships WHERE relationship_id=$1");

  conn.prepare("delete_relationships_for_entity", "DELETE FROM entity_relationships WHERE source_id=$1 OR target_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace datagraph::db::postgres

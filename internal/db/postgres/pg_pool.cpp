#include "pg_pool.hpp"

namespace flowsched::db::postgres {

namespace {

class WorkMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkMigrationExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::Bootstrap() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  WorkMigrationExecutor executor(tx);
  sql::RunMigrations(executor, sql::PostgresSchema());

  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_deployment",
               "INSERT INTO deployment(id,name,flow_id,created_at_ms) "
               "VALUES($1,$2,$3,$4)");

  conn.prepare("get_deployment",
               "SELECT id,name,flow_id,created_at_ms "
               "FROM deployment WHERE id=$1");

  conn.prepare("delete_deployment", "DELETE FROM deployment WHERE id=$1");

  conn.prepare("insert_schedule",
               "INSERT INTO deployment_schedule(id,deployment_id,interval_seconds,anchor_ms,parameters,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6)");

  conn.prepare("list_schedules",
               "SELECT id,deployment_id,interval_seconds,anchor_ms,parameters::text,created_at_ms "
               "FROM deployment_schedule WHERE deployment_id=$1 ORDER BY created_at_ms ASC, id ASC");

  conn.prepare("delete_schedule", "DELETE FROM deployment_schedule WHERE id=$1");

  conn.prepare("get_flow_run",
               "SELECT id,flow_id,deployment_id,parameters::text,idempotency_key,tags::text,schedule_id,auto_scheduled,state_id,created_at_ms "
               "FROM flow_run WHERE id=$1");

  conn.prepare("list_flow_runs",
               "SELECT id,flow_id,deployment_id,parameters::text,idempotency_key,tags::text,schedule_id,auto_scheduled,state_id,created_at_ms "
               "FROM flow_run WHERE deployment_id=$1 ORDER BY created_at_ms ASC, id ASC");

  conn.prepare("list_flow_run_states",
               "SELECT id,flow_run_id,type,message,state_details::text,created_at_ms "
               "FROM flow_run_state WHERE flow_run_id=$1 ORDER BY created_at_ms ASC, id ASC");
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

} // namespace flowsched::db::postgres

#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace flowsched::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository.

  Design notes:
  -------------
  - Each transaction holds its own connection until it finishes.
  - libpqxx connections are NOT thread-safe, do not share.
  - Fixed-shape statements are prepared per connection. Statements that
    take an id list are built per call (see sql_params.hpp).
  - At most max_connections are open; Acquire() blocks beyond that.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection; returned to the pool on release.
  std::shared_ptr<pqxx::connection> Acquire();

  // Create tables and indexes if missing.
  void Bootstrap();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace flowsched::db::postgres

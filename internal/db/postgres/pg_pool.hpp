#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace sessionkeeper::db::postgres {

/*
  PgPool

  Connection pool used by PgSessionStore.

  Design notes:
  -------------
  - Each store operation gets its own connection.
  - libpqxx connections are NOT thread-safe, do not share.
  - Prepared statements and statement_timeout are installed per connection.
  - Acquire waits at most acquire_timeout for a free slot, then throws
    util::StoreUnavailable.

  Lifetime:
    Store owns shared_ptr<PgPool>
    Operation acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 16, int statement_timeout_ms = 5000,
         std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5));

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  void                              PrepareConnection(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  int                       statement_timeout_ms_;
  std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace sessionkeeper::db::postgres

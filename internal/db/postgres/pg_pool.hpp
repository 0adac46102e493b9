#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

namespace wfrun::db::postgres {

/*
  PgPool

  Bounded set of libpqxx connections shared by PgRepository transactions.
  A connection serves one transaction at a time and goes back to the
  pool when the last shared_ptr from Acquire() is dropped.

  Pooled connections carry the run/node-run prepared statements, so the
  schema has to exist before the first Acquire(). Migrations use
  Connect(), which bypasses the pool.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections);

  // Bare connection with no prepared statements.
  std::unique_ptr<pqxx::connection> Connect() const;

  // Waits while every connection is checked out.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(std::unique_ptr<pqxx::connection> conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                    mutex_;
  std::condition_variable                       returned_;
  std::deque<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                   open_ = 0;
};

} // namespace wfrun::db::postgres

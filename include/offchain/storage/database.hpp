#pragma once

#include <offchain/storage/backends/backend.hpp>
#include <offchain/storage/error.hpp>
#include <offchain/storage/transaction.hpp>

#include <filesystem>
#include <memory>
#include <optional>

namespace offchain::storage {

struct database_options
{
  // When empty the database lives in memory only.
  std::optional< std::filesystem::path > path;
  bool create_if_missing = true;
  bool sync_writes       = false;
};

/**
 * database owns the physical backend shared by every column and hands out
 * transactions over it.
 *
 * Transactions may be created and committed from different threads. Each
 * commit is atomic, but transactions are not isolated from one another: the
 * last commit to write a key wins.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database.
   */
  result< void > open( const database_options& options = {} );

  /**
   * Open the database over an existing backend.
   */
  void open( std::shared_ptr< backends::abstract_backend > backend );

  /**
   * Close the database. Outstanding transactions keep the backend alive until
   * they are destroyed.
   */
  void close();

  bool is_open() const noexcept;

  /**
   * Begin a new transaction over the current committed state.
   */
  transaction make_transaction() const;

  const std::shared_ptr< backends::abstract_backend >& backend() const noexcept;

private:
  std::shared_ptr< backends::abstract_backend > _backend;
};

} // namespace offchain::storage

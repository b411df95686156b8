#pragma once

#include <offchain/storage/backends/backend.hpp>

#include <map>
#include <shared_mutex>

namespace offchain::storage::backends::map {

using map_type = std::map< bytes, bytes >;

/**
 * In memory backend. Reads take a shared lock, batches an exclusive lock, so a
 * batch is observed entirely or not at all.
 */
class map_backend: public abstract_backend
{
public:
  map_backend();
  ~map_backend() override;

  result< std::optional< bytes > > get( const bytes& key ) const override;
  result< key_value_pairs > scan( std::span< const std::byte > prefix ) const override;
  result< void > write( const write_batch& batch ) override;

  std::uint64_t size() const override;

  void clear() noexcept;

private:
  mutable std::shared_mutex _mutex;
  map_type _map;
};

} // namespace offchain::storage::backends::map

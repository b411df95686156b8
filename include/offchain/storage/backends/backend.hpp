#pragma once

#include <offchain/storage/backends/write_batch.hpp>
#include <offchain/storage/codec.hpp>
#include <offchain/storage/error.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace offchain::storage::backends {

using key_value_pairs = std::vector< std::pair< bytes, bytes > >;

/**
 * The physical key value store underneath every column.
 *
 * Implementations must be safe to read concurrently with a write and must
 * apply a write_batch atomically: after write() returns an error, none of the
 * batch's operations are visible.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = delete;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = delete;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual result< std::optional< bytes > > get( const bytes& key ) const = 0;

  /**
   * Every entry whose key starts with prefix, in ascending key order.
   */
  virtual result< key_value_pairs > scan( std::span< const std::byte > prefix ) const = 0;

  virtual result< void > write( const write_batch& batch ) = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;
};

} // namespace offchain::storage::backends

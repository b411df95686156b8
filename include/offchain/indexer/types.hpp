#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include <boost/serialization/array.hpp>
#include <boost/serialization/std_variant.hpp>
#include <boost/serialization/string.hpp>

namespace offchain::indexer {

constexpr std::size_t bytes32_size = 32;

using bytes32      = std::array< std::byte, bytes32_size >;
using address      = bytes32;
using tx_id        = bytes32;
using block_id     = bytes32;
using nonce        = bytes32;
using block_height = std::uint32_t;
using tx_index     = std::uint16_t;

// Timestamps are TAI64 seconds.
using timestamp = std::uint64_t;

struct utxo_id
{
  tx_id transaction;
  std::uint16_t output_index = 0;

  bool operator==( const utxo_id& ) const = default;
};

// Value of membership tables: the key exists while the relation holds.
struct marker
{
  bool operator==( const marker& ) const = default;

  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct submitted_status
{
  timestamp time = 0;

  bool operator==( const submitted_status& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & time;
  }
};

struct success_status
{
  block_height height     = 0;
  timestamp time          = 0;
  std::uint64_t total_gas = 0;
  std::uint64_t total_fee = 0;

  bool operator==( const success_status& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & height;
    ar & time;
    ar & total_gas;
    ar & total_fee;
  }
};

struct squeezed_out_status
{
  std::string reason;

  bool operator==( const squeezed_out_status& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & reason;
  }
};

struct failure_status
{
  block_height height     = 0;
  timestamp time          = 0;
  std::string reason;
  std::uint64_t total_gas = 0;
  std::uint64_t total_fee = 0;

  bool operator==( const failure_status& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & height;
    ar & time;
    ar & reason;
    ar & total_gas;
    ar & total_fee;
  }
};

/**
 * Execution status of a transaction as seen by this node. The alternative
 * order is persisted and must not change.
 */
using transaction_status = std::variant< submitted_status, success_status, squeezed_out_status, failure_status >;

/**
 * Key of the owned transaction index. Encoded as owner, then big-endian
 * height, then big-endian index, so entries of one owner sort in execution
 * order.
 */
struct owned_transaction_key
{
  address owner;
  block_height height = 0;
  tx_index index      = 0;

  auto operator<=>( const owned_transaction_key& ) const = default;
};

struct owned_coin_key
{
  address owner;
  utxo_id coin;

  bool operator==( const owned_coin_key& ) const = default;
};

struct owned_message_key
{
  address owner;
  nonce message;

  bool operator==( const owned_message_key& ) const = default;
};

} // namespace offchain::indexer

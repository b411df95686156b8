#pragma once

#include <offchain/indexer/codec.hpp>
#include <offchain/indexer/types.hpp>
#include <offchain/storage/column.hpp>
#include <offchain/storage/table.hpp>

#include <string>

namespace offchain::indexer {

// Transactions an owner took part in, by (owner, height, index).
struct owned_transactions
{
  using key_type   = owned_transaction_key;
  using value_type = tx_id;

  static constexpr storage::column column = storage::column::transactions_by_owner_block_idx;
};

struct transaction_statuses
{
  using key_type   = tx_id;
  using value_type = transaction_status;

  static constexpr storage::column column = storage::column::transaction_status;
};

struct statistic_tag
{};

/**
 * Chain statistics keyed by name. Every instantiation is a view of the same
 * logical table with a different value type.
 */
template< typename V >
struct statistic_table
{
  using key_type      = std::string;
  using value_type    = V;
  using logical_table = statistic_tag;

  static constexpr storage::column column = storage::column::statistic;
};

// Membership: the key exists while the owner holds the coin.
struct owned_coins
{
  using key_type   = owned_coin_key;
  using value_type = marker;

  static constexpr storage::column column = storage::column::owned_coins;
};

struct owned_message_ids
{
  using key_type   = owned_message_key;
  using value_type = marker;

  static constexpr storage::column column = storage::column::owned_message_ids;
};

struct block_ids_to_heights
{
  using key_type   = block_id;
  using value_type = block_height;

  static constexpr storage::column column = storage::column::fuel_block_ids_to_heights;
};

struct spent_messages
{
  using key_type   = nonce;
  using value_type = marker;

  static constexpr storage::column column = storage::column::spent_messages;
};

using offchain_schema = storage::schema< owned_transactions,
                                         transaction_statuses,
                                         statistic_table< std::uint64_t >,
                                         owned_coins,
                                         owned_message_ids,
                                         block_ids_to_heights,
                                         spent_messages >;

} // namespace offchain::indexer

#pragma once

#include <offchain/indexer/tables.hpp>
#include <offchain/indexer/types.hpp>
#include <offchain/storage/error.hpp>
#include <offchain/storage/transaction.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace offchain::indexer {

template< typename T >
using result = storage::result< T >;

// Statistic key of the total number of transactions written to the chain.
constexpr std::string_view tx_count_key = "total_tx_count";

using owned_transaction_list = std::vector< std::pair< owned_transaction_key, tx_id > >;

/**
 * Off-chain index updates for one unit of chain progress, typically a block.
 *
 * Every operation is staged in the wrapped storage transaction; nothing is
 * visible to other readers until commit() succeeds, and then all of it is.
 * Storage and decoding errors are returned unchanged.
 */
class offchain_transaction final
{
public:
  explicit offchain_transaction( storage::transaction&& tx ) noexcept;
  offchain_transaction( const offchain_transaction& ) = delete;
  offchain_transaction( offchain_transaction&& )      = default;
  ~offchain_transaction()                             = default;

  offchain_transaction& operator=( const offchain_transaction& ) = delete;
  offchain_transaction& operator=( offchain_transaction&& )      = default;

  /**
   * Index tx_id under its owner at (height, index). An existing entry at the
   * same position is overwritten.
   */
  result< void > record_tx_id_owner( const address& owner, block_height height, tx_index index, const tx_id& id );

  /**
   * All transactions of owner in (height, index) order.
   */
  result< owned_transaction_list > owned_transactions( const address& owner ) const;

  /**
   * Transactions of owner within one block, in index order.
   */
  result< owned_transaction_list > owned_transactions( const address& owner, block_height height ) const;

  /**
   * Set the status of a transaction. Returns the previous status, if any.
   */
  result< std::optional< transaction_status > > update_tx_status( const tx_id& id, const transaction_status& status );
  result< std::optional< transaction_status > > get_tx_status( const tx_id& id ) const;

  /**
   * Add to the total transaction count, saturating at the maximum value.
   * Returns the new total.
   */
  result< std::uint64_t > increase_tx_count( std::uint64_t new_txs_count );
  result< std::uint64_t > get_tx_count() const;

  /**
   * Overwrite the total transaction count. Used when the chain is restarted
   * from a new genesis; increase_tx_count never lowers the count.
   */
  result< void > reset_tx_count( std::uint64_t count = 0 );

  result< void > record_coin_owner( const address& owner, const utxo_id& coin );
  result< bool > remove_coin_owner( const address& owner, const utxo_id& coin );
  result< bool > owns_coin( const address& owner, const utxo_id& coin ) const;

  result< void > record_message_owner( const address& owner, const nonce& message );
  result< bool > remove_message_owner( const address& owner, const nonce& message );
  result< bool > owns_message( const address& owner, const nonce& message ) const;

  result< void > record_block_height( const block_id& id, block_height height );
  result< std::optional< block_height > > get_block_height( const block_id& id ) const;

  result< void > mark_message_spent( const nonce& message );
  result< bool > is_message_spent( const nonce& message ) const;

  storage::transaction& storage_transaction() noexcept;

  result< void > commit() &&;

private:
  result< owned_transaction_list > scan_owned( std::span< const std::byte > prefix ) const;

  storage::transaction _tx;
};

} // namespace offchain::indexer

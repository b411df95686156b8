#include <offchain/indexer/offchain_transaction.hpp>

#include <offchain/log/log.hpp>

#include <limits>
#include <string>

namespace offchain::indexer {

namespace {

using tx_count_table = statistic_table< std::uint64_t >;

static_assert( offchain_schema::contains< owned_transactions > );
static_assert( offchain_schema::contains< transaction_statuses > );
static_assert( offchain_schema::contains< tx_count_table > );

std::uint64_t saturating_add( std::uint64_t a, std::uint64_t b ) noexcept
{
  constexpr auto max = std::numeric_limits< std::uint64_t >::max();
  return a > max - b ? max : a + b;
}

} // namespace

offchain_transaction::offchain_transaction( storage::transaction&& tx ) noexcept:
    _tx( std::move( tx ) )
{}

result< void >
offchain_transaction::record_tx_id_owner( const address& owner, block_height height, tx_index index, const tx_id& id )
{
  return _tx.insert< indexer::owned_transactions >( owned_transaction_key{ owner, height, index }, id );
}

result< owned_transaction_list > offchain_transaction::owned_transactions( const address& owner ) const
{
  return scan_owned( storage::to_bytes( owner ) );
}

result< owned_transaction_list > offchain_transaction::owned_transactions( const address& owner,
                                                                           block_height height ) const
{
  storage::bytes prefix;
  storage::encode_fields( prefix, owner, height );
  return scan_owned( prefix );
}

result< owned_transaction_list > offchain_transaction::scan_owned( std::span< const std::byte > prefix ) const
{
  return _tx.scan< indexer::owned_transactions >( prefix );
}

result< std::optional< transaction_status > > offchain_transaction::update_tx_status( const tx_id& id,
                                                                                      const transaction_status& status )
{
  LOG_DEBUG( log::instance(),
             "Transaction {} status changed to variant {}",
             log::hex{ id.data(), id.size() },
             status.index() );
  return _tx.replace< transaction_statuses >( id, status );
}

result< std::optional< transaction_status > > offchain_transaction::get_tx_status( const tx_id& id ) const
{
  return _tx.get< transaction_statuses >( id );
}

result< std::uint64_t > offchain_transaction::increase_tx_count( std::uint64_t new_txs_count )
{
  auto current = get_tx_count();
  if( !current )
    return current;

  auto total = saturating_add( *current, new_txs_count );
  if( total == std::numeric_limits< std::uint64_t >::max() && *current != total )
    LOG_WARNING( log::instance(), "Transaction count saturated after adding {}", new_txs_count );

  if( auto inserted = _tx.insert< tx_count_table >( std::string( tx_count_key ), total ); !inserted )
    return std::unexpected( inserted.error() );

  return total;
}

result< std::uint64_t > offchain_transaction::get_tx_count() const
{
  auto count = _tx.get< tx_count_table >( std::string( tx_count_key ) );
  if( !count )
    return std::unexpected( count.error() );

  return count->value_or( 0 );
}

result< void > offchain_transaction::reset_tx_count( std::uint64_t count )
{
  LOG_INFO( log::instance(), "Resetting transaction count to {}", count );
  return _tx.insert< tx_count_table >( std::string( tx_count_key ), count );
}

result< void > offchain_transaction::record_coin_owner( const address& owner, const utxo_id& coin )
{
  return _tx.insert< owned_coins >( owned_coin_key{ owner, coin }, marker{} );
}

result< bool > offchain_transaction::remove_coin_owner( const address& owner, const utxo_id& coin )
{
  auto previous = _tx.remove< owned_coins >( owned_coin_key{ owner, coin } );
  if( !previous )
    return std::unexpected( previous.error() );

  return previous->has_value();
}

result< bool > offchain_transaction::owns_coin( const address& owner, const utxo_id& coin ) const
{
  return _tx.contains< owned_coins >( owned_coin_key{ owner, coin } );
}

result< void > offchain_transaction::record_message_owner( const address& owner, const nonce& message )
{
  return _tx.insert< owned_message_ids >( owned_message_key{ owner, message }, marker{} );
}

result< bool > offchain_transaction::remove_message_owner( const address& owner, const nonce& message )
{
  auto previous = _tx.remove< owned_message_ids >( owned_message_key{ owner, message } );
  if( !previous )
    return std::unexpected( previous.error() );

  return previous->has_value();
}

result< bool > offchain_transaction::owns_message( const address& owner, const nonce& message ) const
{
  return _tx.contains< owned_message_ids >( owned_message_key{ owner, message } );
}

result< void > offchain_transaction::record_block_height( const block_id& id, block_height height )
{
  return _tx.insert< block_ids_to_heights >( id, height );
}

result< std::optional< block_height > > offchain_transaction::get_block_height( const block_id& id ) const
{
  return _tx.get< block_ids_to_heights >( id );
}

result< void > offchain_transaction::mark_message_spent( const nonce& message )
{
  return _tx.insert< spent_messages >( message, marker{} );
}

result< bool > offchain_transaction::is_message_spent( const nonce& message ) const
{
  return _tx.contains< spent_messages >( message );
}

storage::transaction& offchain_transaction::storage_transaction() noexcept
{
  return _tx;
}

result< void > offchain_transaction::commit() &&
{
  return std::move( _tx ).commit();
}

} // namespace offchain::indexer

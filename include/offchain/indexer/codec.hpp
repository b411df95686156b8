#pragma once

#include <offchain/indexer/types.hpp>
#include <offchain/storage/codec.hpp>

namespace offchain::storage {

// Key encodings of the indexer tables.

template<>
struct codec< indexer::utxo_id >
{
  static void encode( const indexer::utxo_id& id, bytes& out )
  {
    encode_fields( out, id.transaction, id.output_index );
  }

  static encode::result< indexer::utxo_id > decode( reader& in )
  {
    indexer::utxo_id id;
    if( auto status = decode_fields( in, id.transaction, id.output_index ); !status )
      return std::unexpected( status.error() );
    return id;
  }
};

template<>
struct codec< indexer::owned_transaction_key >
{
  static void encode( const indexer::owned_transaction_key& k, bytes& out )
  {
    encode_fields( out, k.owner, k.height, k.index );
  }

  static encode::result< indexer::owned_transaction_key > decode( reader& in )
  {
    indexer::owned_transaction_key k;
    if( auto status = decode_fields( in, k.owner, k.height, k.index ); !status )
      return std::unexpected( status.error() );
    return k;
  }
};

template<>
struct codec< indexer::owned_coin_key >
{
  static void encode( const indexer::owned_coin_key& k, bytes& out )
  {
    encode_fields( out, k.owner, k.coin );
  }

  static encode::result< indexer::owned_coin_key > decode( reader& in )
  {
    indexer::owned_coin_key k;
    if( auto status = decode_fields( in, k.owner, k.coin ); !status )
      return std::unexpected( status.error() );
    return k;
  }
};

template<>
struct codec< indexer::owned_message_key >
{
  static void encode( const indexer::owned_message_key& k, bytes& out )
  {
    encode_fields( out, k.owner, k.message );
  }

  static encode::result< indexer::owned_message_key > decode( reader& in )
  {
    indexer::owned_message_key k;
    if( auto status = decode_fields( in, k.owner, k.message ); !status )
      return std::unexpected( status.error() );
    return k;
  }
};

} // namespace offchain::storage

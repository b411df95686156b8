#pragma once

#include <offchain/storage/archive.hpp>
#include <offchain/storage/backends/backend.hpp>
#include <offchain/storage/backends/write_batch.hpp>
#include <offchain/storage/codec.hpp>
#include <offchain/storage/column.hpp>
#include <offchain/storage/error.hpp>
#include <offchain/storage/table.hpp>

#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace offchain::storage {

constexpr std::size_t column_prefix_size = sizeof( std::uint32_t );

/**
 * Physical key of a table entry: the big-endian column id followed by the
 * encoded table key.
 */
inline bytes make_compound_key( column c, std::span< const std::byte > key )
{
  bytes compound_key;
  compound_key.reserve( column_prefix_size + key.size() );
  encode_into( column_id( c ), compound_key );
  compound_key.insert( compound_key.end(), key.begin(), key.end() );
  return compound_key;
}

/**
 * A buffered set of writes over a base backend.
 *
 * Reads see this transaction's own staged writes first and fall through to
 * the backend otherwise. Nothing reaches the backend until commit(), which
 * writes every staged change, across every column, in one batch. Destroying a
 * transaction without committing discards its changes.
 *
 * A transaction is used by a single owner. Using it after commit() throws
 * std::logic_error.
 */
class transaction final
{
public:
  explicit transaction( std::shared_ptr< backends::abstract_backend > base ) noexcept;
  transaction( const transaction& ) = delete;
  transaction( transaction&& ) noexcept;
  ~transaction();

  transaction& operator=( const transaction& ) = delete;
  transaction& operator=( transaction&& ) noexcept;

  result< std::optional< bytes > > get( column c, std::span< const std::byte > key ) const;
  void put( column c, std::span< const std::byte > key, bytes&& value );
  void erase( column c, std::span< const std::byte > key );

  /**
   * Entries of column c whose encoded key starts with prefix, in key order.
   * Returned keys have the column prefix stripped.
   */
  result< backends::key_value_pairs > scan( column c, std::span< const std::byte > prefix ) const;

  template< table T >
  result< std::optional< typename T::value_type > > get( const typename T::key_type& key ) const;

  template< table T >
  result< bool > contains( const typename T::key_type& key ) const;

  template< table T >
  result< void > insert( const typename T::key_type& key, const typename T::value_type& value );

  template< table T >
  result< std::optional< typename T::value_type > > replace( const typename T::key_type& key,
                                                             const typename T::value_type& value );

  template< table T >
  result< std::optional< typename T::value_type > > remove( const typename T::key_type& key );

  template< table T >
  result< std::vector< std::pair< typename T::key_type, typename T::value_type > > >
  scan( std::span< const std::byte > prefix = {} ) const;

  /**
   * Atomically apply all staged changes to the backend. On error nothing is
   * applied. The transaction is consumed either way.
   */
  result< void > commit() &&;

  std::size_t staged() const noexcept;

private:
  void check_usable() const;

  template< typename V >
  static result< std::optional< V > > decode_optional( result< std::optional< bytes > >&& raw );

  std::shared_ptr< backends::abstract_backend > _base;
  backends::write_batch _changes;
  bool _committed = false;
};

template< typename V >
result< std::optional< V > > transaction::decode_optional( result< std::optional< bytes > >&& raw )
{
  if( !raw )
    return std::unexpected( raw.error() );

  if( !raw->has_value() )
    return std::optional< V >{};

  auto value = deserialize_value< V >( **raw );
  if( !value )
    return std::unexpected( value.error() );

  return std::optional< V >( std::move( *value ) );
}

template< table T >
result< std::optional< typename T::value_type > > transaction::get( const typename T::key_type& key ) const
{
  return decode_optional< typename T::value_type >( get( T::column, to_bytes( key ) ) );
}

template< table T >
result< bool > transaction::contains( const typename T::key_type& key ) const
{
  auto raw = get( T::column, to_bytes( key ) );
  if( !raw )
    return std::unexpected( raw.error() );

  return raw->has_value();
}

template< table T >
result< void > transaction::insert( const typename T::key_type& key, const typename T::value_type& value )
{
  put( T::column, to_bytes( key ), serialize_value( value ) );
  return {};
}

template< table T >
result< std::optional< typename T::value_type > > transaction::replace( const typename T::key_type& key,
                                                                        const typename T::value_type& value )
{
  auto encoded_key = to_bytes( key );
  auto previous    = decode_optional< typename T::value_type >( get( T::column, encoded_key ) );
  if( !previous )
    return previous;

  put( T::column, encoded_key, serialize_value( value ) );
  return previous;
}

template< table T >
result< std::optional< typename T::value_type > > transaction::remove( const typename T::key_type& key )
{
  auto encoded_key = to_bytes( key );
  auto previous    = decode_optional< typename T::value_type >( get( T::column, encoded_key ) );
  if( !previous )
    return previous;

  erase( T::column, encoded_key );
  return previous;
}

template< table T >
result< std::vector< std::pair< typename T::key_type, typename T::value_type > > >
transaction::scan( std::span< const std::byte > prefix ) const
{
  using key_type   = typename T::key_type;
  using value_type = typename T::value_type;

  auto raw = scan( T::column, prefix );
  if( !raw )
    return std::unexpected( raw.error() );

  std::vector< std::pair< key_type, value_type > > entries;
  entries.reserve( raw->size() );

  for( const auto& [ raw_key, raw_value ]: *raw )
  {
    auto key = from_bytes< key_type >( raw_key );
    if( !key )
      return std::unexpected( key.error() );

    auto value = deserialize_value< value_type >( raw_value );
    if( !value )
      return std::unexpected( value.error() );

    entries.emplace_back( std::move( *key ), std::move( *value ) );
  }

  return entries;
}

} // namespace offchain::storage

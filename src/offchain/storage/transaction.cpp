#include <offchain/storage/transaction.hpp>

#include <offchain/log/log.hpp>

#include <algorithm>
#include <map>
#include <stdexcept>

namespace offchain::storage {

namespace {

bool starts_with( std::span< const std::byte > key, std::span< const std::byte > prefix )
{
  return key.size() >= prefix.size() && std::ranges::equal( key.first( prefix.size() ), prefix );
}

} // namespace

transaction::transaction( std::shared_ptr< backends::abstract_backend > base ) noexcept:
    _base( std::move( base ) )
{}

transaction::transaction( transaction&& other ) noexcept:
    _base( std::move( other._base ) ),
    _changes( std::move( other._changes ) ),
    _committed( other._committed )
{}

transaction::~transaction()
{
  if( !_committed && !_changes.empty() )
    LOG_DEBUG( log::instance(), "Discarding {} uncommitted operations", _changes.size() );
}

transaction& transaction::operator=( transaction&& other ) noexcept
{
  _base      = std::move( other._base );
  _changes   = std::move( other._changes );
  _committed = other._committed;
  return *this;
}

void transaction::check_usable() const
{
  if( _committed )
    throw std::logic_error( "transaction has already been committed" );

  if( !_base )
    throw std::logic_error( "transaction has no backend" );
}

result< std::optional< bytes > > transaction::get( column c, std::span< const std::byte > key ) const
{
  check_usable();

  auto compound_key = make_compound_key( c, key );

  if( auto itr = _changes.operations().find( compound_key ); itr != _changes.operations().end() )
    return itr->second;

  return _base->get( compound_key );
}

void transaction::put( column c, std::span< const std::byte > key, bytes&& value )
{
  check_usable();
  LOG_TRACE_L1( log::instance(), "Staging put to {} key {}", c, log::hex{ key.data(), key.size() } );
  _changes.put( make_compound_key( c, key ), std::move( value ) );
}

void transaction::erase( column c, std::span< const std::byte > key )
{
  check_usable();
  LOG_TRACE_L1( log::instance(), "Staging removal from {} key {}", c, log::hex{ key.data(), key.size() } );
  _changes.remove( make_compound_key( c, key ) );
}

result< backends::key_value_pairs > transaction::scan( column c, std::span< const std::byte > prefix ) const
{
  check_usable();

  auto compound_prefix = make_compound_key( c, prefix );

  auto base_entries = _base->scan( compound_prefix );
  if( !base_entries )
    return std::unexpected( base_entries.error() );

  std::map< bytes, bytes > merged;
  for( auto& [ key, value ]: *base_entries )
    merged.insert_or_assign( std::move( key ), std::move( value ) );

  const auto& staged = _changes.operations();
  for( auto itr = staged.lower_bound( compound_prefix ); itr != staged.end() && starts_with( itr->first, compound_prefix );
       ++itr )
  {
    if( itr->second )
      merged.insert_or_assign( itr->first, *itr->second );
    else
      merged.erase( itr->first );
  }

  backends::key_value_pairs entries;
  entries.reserve( merged.size() );

  for( auto& [ key, value ]: merged )
    entries.emplace_back( bytes( key.begin() + column_prefix_size, key.end() ), std::move( value ) );

  return entries;
}

result< void > transaction::commit() &&
{
  check_usable();
  _committed = true;

  auto changes = std::move( _changes );
  _changes     = {};

  if( changes.empty() )
    return {};

  LOG_DEBUG( log::instance(), "Committing {} staged operations", changes.size() );

  if( auto written = _base->write( changes ); !written )
  {
    LOG_ERROR( log::instance(), "Commit of {} operations failed: {}", changes.size(), written.error().message() );
    return std::unexpected( written.error() );
  }

  return {};
}

std::size_t transaction::staged() const noexcept
{
  return _changes.size();
}

} // namespace offchain::storage

#include <offchain/storage/backends/map/map_backend.hpp>

#include <algorithm>
#include <mutex>
#include <new>

namespace offchain::storage::backends::map {

map_backend::map_backend():
    abstract_backend()
{}

map_backend::~map_backend() {}

result< std::optional< bytes > > map_backend::get( const bytes& key ) const
{
  std::shared_lock lock( _mutex );

  if( auto itr = _map.find( key ); itr != _map.end() )
    return itr->second;

  return std::optional< bytes >{};
}

result< key_value_pairs > map_backend::scan( std::span< const std::byte > prefix ) const
{
  std::shared_lock lock( _mutex );

  key_value_pairs pairs;
  for( auto itr = _map.lower_bound( bytes( prefix.begin(), prefix.end() ) ); itr != _map.end(); ++itr )
  {
    if( !std::ranges::equal( std::span( itr->first ).first( std::min( prefix.size(), itr->first.size() ) ), prefix ) )
      break;

    pairs.emplace_back( itr->first, itr->second );
  }

  return pairs;
}

result< void > map_backend::write( const write_batch& batch )
{
  // Every allocation happens while staging. Publishing only relinks nodes and
  // erases, neither of which throws, so the batch lands whole or not at all.
  map_type staged;
  try
  {
    for( const auto& [ key, value ]: batch.operations() )
    {
      if( value )
        staged.emplace( key, *value );
    }
  }
  catch( const std::bad_alloc& )
  {
    return std::unexpected( storage_errc::resource_exhausted );
  }

  std::unique_lock lock( _mutex );

  for( const auto& [ key, value ]: batch.operations() )
  {
    if( !value )
      _map.erase( key );
  }

  while( !staged.empty() )
  {
    auto node = staged.extract( staged.begin() );

    if( auto itr = _map.find( node.key() ); itr != _map.end() )
      itr->second.swap( node.mapped() );
    else
      _map.insert( std::move( node ) );
  }

  return {};
}

std::uint64_t map_backend::size() const
{
  std::shared_lock lock( _mutex );
  return _map.size();
}

void map_backend::clear() noexcept
{
  std::unique_lock lock( _mutex );
  _map.clear();
}

} // namespace offchain::storage::backends::map

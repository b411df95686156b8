#include <offchain/storage/database.hpp>

#include <offchain/log/log.hpp>
#include <offchain/storage/backends/map/map_backend.hpp>
#include <offchain/storage/backends/rocksdb/rocksdb_backend.hpp>

#include <stdexcept>

namespace offchain::storage {

database::database() noexcept {}

database::~database()
{
  close();
}

result< void > database::open( const database_options& options )
{
  if( options.path )
  {
    std::error_code ec;
    if( options.create_if_missing && !std::filesystem::exists( *options.path, ec ) )
    {
      std::filesystem::create_directories( *options.path, ec );
      if( ec )
      {
        LOG_ERROR( log::instance(), "Unable to create database directory {}: {}", options.path->string(), ec.message() );
        return std::unexpected( storage_errc::io_error );
      }
    }

    auto backend = std::make_shared< backends::rocksdb::rocksdb_backend >();
    if( auto opened = backend->open( *options.path, options.create_if_missing, options.sync_writes ); !opened )
      return opened;

    _backend = backend;
  }
  else
  {
    LOG_INFO( log::instance(), "Opening in memory database" );
    _backend = std::make_shared< backends::map::map_backend >();
  }

  LOG_DEBUG( log::instance(), "Database opened with {} columns", column_count );
  return {};
}

void database::open( std::shared_ptr< backends::abstract_backend > backend )
{
  if( !backend )
    throw std::invalid_argument( "database backend cannot be null" );

  _backend = std::move( backend );
}

void database::close()
{
  if( _backend )
    LOG_INFO( log::instance(), "Closing database" );

  _backend.reset();
}

bool database::is_open() const noexcept
{
  return static_cast< bool >( _backend );
}

transaction database::make_transaction() const
{
  if( !_backend )
    throw std::runtime_error( "database is not open" );

  return transaction( _backend );
}

const std::shared_ptr< backends::abstract_backend >& database::backend() const noexcept
{
  return _backend;
}

} // namespace offchain::storage

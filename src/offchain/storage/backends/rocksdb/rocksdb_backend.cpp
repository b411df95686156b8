#include <offchain/storage/backends/rocksdb/rocksdb_backend.hpp>

#include <offchain/log/log.hpp>
#include <offchain/memory/memory.hpp>

#include <rocksdb/iterator.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>

namespace offchain::storage::backends::rocksdb {

namespace {

::rocksdb::Slice to_slice( std::span< const std::byte > s )
{
  return ::rocksdb::Slice( memory::pointer_cast< const char* >( s.data() ), s.size() );
}

bytes to_bytes( const ::rocksdb::Slice& s )
{
  auto data = memory::pointer_cast< const std::byte* >( s.data() );
  return bytes( data, data + s.size() );
}

} // namespace

std::error_code make_error_code( const ::rocksdb::Status& status )
{
  if( status.ok() )
    return storage_errc::ok;

  if( status.IsCorruption() )
    return storage_errc::corruption;

  if( status.IsNoSpace() || status.IsMemoryLimit() )
    return storage_errc::resource_exhausted;

  if( status.IsBusy() || status.IsTryAgain() || status.IsTimedOut() )
    return storage_errc::busy;

  if( status.IsNotSupported() )
    return storage_errc::not_supported;

  return storage_errc::io_error;
}

rocksdb_backend::rocksdb_backend():
    abstract_backend()
{}

rocksdb_backend::~rocksdb_backend()
{
  close();
}

result< void > rocksdb_backend::open( const std::filesystem::path& p, bool create_if_missing, bool sync_writes )
{
  ::rocksdb::Options options;
  options.create_if_missing = create_if_missing;

  ::rocksdb::DB* db = nullptr;
  auto status       = ::rocksdb::DB::Open( options, p.string(), &db );
  if( !status.ok() )
  {
    LOG_ERROR( log::instance(), "Unable to open rocksdb at {}: {}", p.string(), status.ToString() );
    return std::unexpected( make_error_code( status ) );
  }

  _db.reset( db );
  _write_options.sync = sync_writes;

  LOG_INFO( log::instance(), "Opened rocksdb at {}", p.string() );
  return {};
}

void rocksdb_backend::close()
{
  if( !_db )
    return;

  if( auto status = _db->Close(); !status.ok() )
    LOG_WARNING( log::instance(), "Error closing rocksdb: {}", status.ToString() );

  _db.reset();
}

bool rocksdb_backend::is_open() const noexcept
{
  return static_cast< bool >( _db );
}

result< std::optional< bytes > > rocksdb_backend::get( const bytes& key ) const
{
  if( !_db )
    return std::unexpected( storage_errc::database_closed );

  std::string value;
  auto status = _db->Get( _read_options, to_slice( key ), &value );

  if( status.IsNotFound() )
    return std::optional< bytes >{};

  if( !status.ok() )
    return std::unexpected( make_error_code( status ) );

  auto data = memory::pointer_cast< const std::byte* >( value.data() );
  return std::optional< bytes >( bytes( data, data + value.size() ) );
}

result< key_value_pairs > rocksdb_backend::scan( std::span< const std::byte > prefix ) const
{
  if( !_db )
    return std::unexpected( storage_errc::database_closed );

  key_value_pairs pairs;
  auto prefix_slice = to_slice( prefix );

  std::unique_ptr< ::rocksdb::Iterator > itr( _db->NewIterator( _read_options ) );
  for( itr->Seek( prefix_slice ); itr->Valid() && itr->key().starts_with( prefix_slice ); itr->Next() )
    pairs.emplace_back( to_bytes( itr->key() ), to_bytes( itr->value() ) );

  if( auto status = itr->status(); !status.ok() )
    return std::unexpected( make_error_code( status ) );

  return pairs;
}

result< void > rocksdb_backend::write( const write_batch& batch )
{
  if( !_db )
    return std::unexpected( storage_errc::database_closed );

  ::rocksdb::WriteBatch rocksdb_batch;

  for( const auto& [ key, value ]: batch.operations() )
  {
    auto status = value ? rocksdb_batch.Put( to_slice( key ), to_slice( *value ) )
                        : rocksdb_batch.Delete( to_slice( key ) );
    if( !status.ok() )
      return std::unexpected( make_error_code( status ) );
  }

  if( auto status = _db->Write( _write_options, &rocksdb_batch ); !status.ok() )
  {
    LOG_ERROR( log::instance(), "rocksdb batch of {} operations failed: {}", batch.size(), status.ToString() );
    return std::unexpected( make_error_code( status ) );
  }

  return {};
}

std::uint64_t rocksdb_backend::size() const
{
  std::uint64_t keys = 0;
  if( _db && _db->GetIntProperty( "rocksdb.estimate-num-keys", &keys ) )
    return keys;

  return 0;
}

} // namespace offchain::storage::backends::rocksdb

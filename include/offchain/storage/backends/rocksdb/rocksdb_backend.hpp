#pragma once

#include <offchain/storage/backends/backend.hpp>

#include <filesystem>
#include <memory>

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>

namespace offchain::storage::backends::rocksdb {

std::error_code make_error_code( const ::rocksdb::Status& status );

class rocksdb_backend final: public abstract_backend
{
public:
  rocksdb_backend();
  ~rocksdb_backend() override;

  result< void > open( const std::filesystem::path& p, bool create_if_missing = true, bool sync_writes = false );
  void close();
  bool is_open() const noexcept;

  result< std::optional< bytes > > get( const bytes& key ) const override;
  result< key_value_pairs > scan( std::span< const std::byte > prefix ) const override;
  result< void > write( const write_batch& batch ) override;

  std::uint64_t size() const override;

private:
  std::unique_ptr< ::rocksdb::DB > _db;
  ::rocksdb::ReadOptions _read_options;
  ::rocksdb::WriteOptions _write_options;
};

} // namespace offchain::storage::backends::rocksdb

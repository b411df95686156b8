#include <offchain/storage/backends/write_batch.hpp>

#include <utility>

namespace offchain::storage::backends {

void write_batch::put( bytes&& key, bytes&& value )
{
  _operations.insert_or_assign( std::move( key ), std::optional< bytes >( std::move( value ) ) );
}

void write_batch::remove( bytes&& key )
{
  _operations.insert_or_assign( std::move( key ), std::nullopt );
}

std::size_t write_batch::size() const noexcept
{
  return _operations.size();
}

bool write_batch::empty() const noexcept
{
  return _operations.empty();
}

const write_batch::operation_map& write_batch::operations() const noexcept
{
  return _operations;
}

} // namespace offchain::storage::backends

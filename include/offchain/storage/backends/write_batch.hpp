#pragma once

#include <offchain/storage/codec.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace offchain::storage::backends {

/**
 * An ordered set of puts and removals applied to a backend as one unit.
 *
 * A key appears at most once. An empty optional marks a removal.
 */
class write_batch final
{
public:
  using operation_map = std::map< bytes, std::optional< bytes > >;

  void put( bytes&& key, bytes&& value );
  void remove( bytes&& key );

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  const operation_map& operations() const noexcept;

private:
  operation_map _operations;
};

} // namespace offchain::storage::backends

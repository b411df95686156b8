#include <offchain/storage/backends/backend.hpp>

namespace offchain::storage::backends {

bool abstract_backend::empty() const
{
  return size() == 0;
}

} // namespace offchain::storage::backends

#include <offchain/storage/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace offchain::storage {

struct _storage_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "storage";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< storage_errc >( condition ) )
    {
      case storage_errc::ok:
        return "ok"s;
      case storage_errc::io_error:
        return "io error"s;
      case storage_errc::corruption:
        return "corruption"s;
      case storage_errc::resource_exhausted:
        return "resource exhausted"s;
      case storage_errc::busy:
        return "busy"s;
      case storage_errc::not_supported:
        return "not supported"s;
      case storage_errc::database_closed:
        return "database closed"s;
    }
    std::unreachable();
  }
};

const std::error_category& storage_category() noexcept
{
  static _storage_category category;
  return category;
}

std::error_code make_error_code( storage_errc e )
{
  return std::error_code( static_cast< int >( e ), storage_category() );
}

} // namespace offchain::storage

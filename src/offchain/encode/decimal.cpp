#include <offchain/encode/decimal.hpp>

#include <algorithm>
#include <charconv>

namespace offchain::encode {

result< std::uint64_t > from_decimal( std::string_view sv ) noexcept
{
  if( sv.empty() )
    return std::unexpected( encode_errc::invalid_length );

  if( !std::ranges::all_of( sv,
                            []( char c )
                            {
                              return c >= '0' && c <= '9';
                            } ) )
    return std::unexpected( encode_errc::invalid_character );

  std::uint64_t value = 0;
  auto [ ptr, ec ]    = std::from_chars( sv.data(), sv.data() + sv.size(), value );

  if( ec == std::errc::result_out_of_range )
    return std::unexpected( encode_errc::out_of_range );

  if( ec != std::errc{} || ptr != sv.data() + sv.size() )
    return std::unexpected( encode_errc::invalid_character );

  return value;
}

} // namespace offchain::encode

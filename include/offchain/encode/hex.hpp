#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <offchain/encode/error.hpp>

namespace offchain::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decode exactly N bytes, as used for 32 byte ids and addresses given on the
 * command line.
 */
template< std::size_t N >
result< std::array< std::byte, N > > from_hex_array( std::string_view sv ) noexcept
{
  auto decoded = from_hex( sv );
  if( !decoded )
    return std::unexpected( decoded.error() );

  if( decoded->size() != N )
    return std::unexpected( encode_errc::invalid_length );

  std::array< std::byte, N > a;
  std::ranges::copy( *decoded, a.begin() );
  return a;
}

} // namespace offchain::encode

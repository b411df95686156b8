#pragma once

#include <cstdint>
#include <string_view>

#include <offchain/encode/error.hpp>

namespace offchain::encode {

/**
 * Parse an unsigned decimal. Only the digits 0-9 are accepted, so a sign,
 * whitespace or a radix prefix is an invalid character rather than being
 * wrapped into range.
 */
result< std::uint64_t > from_decimal( std::string_view sv ) noexcept;

} // namespace offchain::encode

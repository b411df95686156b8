#pragma once

#include <cstdint>
#include <expected>
#include <system_error>
#include <type_traits>

namespace offchain::storage {

enum class storage_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  io_error,
  corruption,
  resource_exhausted,
  busy,
  not_supported,
  database_closed
};

const std::error_category& storage_category() noexcept;

std::error_code make_error_code( storage_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace offchain::storage

template<>
struct std::is_error_code_enum< offchain::storage::storage_errc >: public std::true_type
{};

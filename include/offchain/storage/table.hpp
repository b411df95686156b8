#pragma once

#include <offchain/storage/archive.hpp>
#include <offchain/storage/codec.hpp>
#include <offchain/storage/column.hpp>

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace offchain::storage {

/**
 * A table binds a key type and a value type to one column. Keys use the
 * order preserving codec, values are archived.
 *
 *   struct my_table
 *   {
 *     using key_type   = ...;
 *     using value_type = ...;
 *     static constexpr storage::column column = storage::column::...;
 *   };
 *
 * Several table types may describe the same logical table with different
 * value views. Such tables name a common `logical_table` type and are then
 * allowed to share a column.
 */
template< typename T >
concept table = requires {
  typename T::key_type;
  typename T::value_type;
  { T::column } -> std::convertible_to< column >;
} && encodable< typename T::key_type > && serializable< typename T::value_type >;

template< typename T >
struct logical_table_of
{
  using type = T;
};

template< typename T >
  requires requires { typename T::logical_table; }
struct logical_table_of< T >
{
  using type = typename T::logical_table;
};

template< typename T >
using logical_table_t = typename logical_table_of< T >::type;

namespace detail {

template< table A, table B >
constexpr bool compatible_pair = A::column != B::column || std::is_same_v< logical_table_t< A >, logical_table_t< B > >;

template< table Head, table... Tail >
constexpr bool compatible_with_all = ( compatible_pair< Head, Tail > && ... );

template< table... Tables >
struct collision_free;

template<>
struct collision_free<>: std::true_type
{};

template< table Head, table... Tail >
struct collision_free< Head, Tail... >:
    std::bool_constant< compatible_with_all< Head, Tail... > && collision_free< Tail... >::value >
{};

} // namespace detail

/**
 * The set of tables a component reads and writes. Two different logical tables
 * on the same column fail to compile.
 */
template< table... Tables >
struct schema
{
  static_assert( detail::collision_free< Tables... >::value, "two tables are bound to the same column" );

  static constexpr std::size_t size = sizeof...( Tables );

  template< table T >
  static constexpr bool contains = ( std::is_same_v< T, Tables > || ... );
};

} // namespace offchain::storage

#pragma once

#include <offchain/encode/error.hpp>
#include <offchain/memory/memory.hpp>

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian/conversion.hpp>

namespace offchain::storage {

using bytes = std::vector< std::byte >;

/**
 * Cursor over an encoded byte sequence.
 */
class reader final
{
public:
  explicit reader( std::span< const std::byte > s ) noexcept:
      _data( s )
  {}

  encode::result< std::span< const std::byte > > take( std::size_t n ) noexcept
  {
    if( n > _data.size() )
      return std::unexpected( encode::encode_errc::invalid_length );

    auto head = _data.first( n );
    _data     = _data.subspan( n );
    return head;
  }

  std::size_t remaining() const noexcept
  {
    return _data.size();
  }

  bool empty() const noexcept
  {
    return _data.empty();
  }

private:
  std::span< const std::byte > _data;
};

/**
 * Byte encoding for table keys and the column prefix.
 *
 * Specializations provide
 *   static void encode( const T&, bytes& out );
 *   static encode::result< T > decode( reader& in );
 *
 * Integers are written big-endian so that the byte order of an encoded key
 * matches its numeric order. Values are not encoded here, see archive.hpp.
 */
template< typename T >
struct codec;

template< typename T >
concept encodable = requires( const T& t, bytes& out, reader& in ) {
  codec< T >::encode( t, out );
  { codec< T >::decode( in ) } -> std::same_as< encode::result< T > >;
};

template< std::unsigned_integral T >
struct codec< T >
{
  static void encode( T t, bytes& out )
  {
    auto big = boost::endian::native_to_big( t );
    std::array< std::byte, sizeof( T ) > buf;
    std::memcpy( buf.data(), &big, sizeof( T ) );
    out.insert( out.end(), buf.begin(), buf.end() );
  }

  static encode::result< T > decode( reader& in )
  {
    auto span = in.take( sizeof( T ) );
    if( !span )
      return std::unexpected( span.error() );

    T big;
    std::memcpy( &big, span->data(), sizeof( T ) );
    return boost::endian::big_to_native( big );
  }
};

template<>
struct codec< bool >
{
  static void encode( bool b, bytes& out )
  {
    out.push_back( b ? std::byte{ 1 } : std::byte{ 0 } );
  }

  static encode::result< bool > decode( reader& in )
  {
    auto span = in.take( 1 );
    if( !span )
      return std::unexpected( span.error() );

    switch( std::to_integer< std::uint8_t >( span->front() ) )
    {
      case 0:
        return false;
      case 1:
        return true;
      default:
        return std::unexpected( encode::encode_errc::unknown_variant );
    }
  }
};

template< std::size_t N >
struct codec< std::array< std::byte, N > >
{
  static void encode( const std::array< std::byte, N >& a, bytes& out )
  {
    out.insert( out.end(), a.begin(), a.end() );
  }

  static encode::result< std::array< std::byte, N > > decode( reader& in )
  {
    auto span = in.take( N );
    if( !span )
      return std::unexpected( span.error() );

    std::array< std::byte, N > a;
    std::ranges::copy( *span, a.begin() );
    return a;
  }
};

namespace detail {

inline void encode_length( std::size_t size, bytes& out )
{
  codec< std::uint32_t >::encode( static_cast< std::uint32_t >( size ), out );
}

inline encode::result< std::span< const std::byte > > decode_sized( reader& in )
{
  auto size = codec< std::uint32_t >::decode( in );
  if( !size )
    return std::unexpected( size.error() );

  return in.take( *size );
}

} // namespace detail

template<>
struct codec< std::string >
{
  static void encode( const std::string& s, bytes& out )
  {
    detail::encode_length( s.size(), out );
    auto raw = std::as_bytes( std::span( s ) );
    out.insert( out.end(), raw.begin(), raw.end() );
  }

  static encode::result< std::string > decode( reader& in )
  {
    auto span = detail::decode_sized( in );
    if( !span )
      return std::unexpected( span.error() );

    return std::string( memory::pointer_cast< const char* >( span->data() ), span->size() );
  }
};

template< encodable T >
void encode_into( const T& t, bytes& out )
{
  codec< T >::encode( t, out );
}

template< encodable T >
encode::result< void > decode_into( reader& in, T& t )
{
  auto value = codec< T >::decode( in );
  if( !value )
    return std::unexpected( value.error() );

  t = std::move( *value );
  return {};
}

template< encodable... Ts >
void encode_fields( bytes& out, const Ts&... fields )
{
  ( encode_into( fields, out ), ... );
}

/**
 * Decode fields in order, stopping at the first failure.
 */
template< encodable... Ts >
encode::result< void > decode_fields( reader& in, Ts&... fields )
{
  encode::result< void > status;
  static_cast< void >( ( ( status = decode_into( in, fields ) ) && ... ) );
  return status;
}

template< encodable T >
bytes to_bytes( const T& t )
{
  bytes out;
  codec< T >::encode( t, out );
  return out;
}

/**
 * Decode a complete value. Bytes left over after decoding are an error.
 */
template< encodable T >
encode::result< T > from_bytes( std::span< const std::byte > s )
{
  reader in( s );
  auto t = codec< T >::decode( in );
  if( !t )
    return t;

  if( !in.empty() )
    return std::unexpected( encode::encode_errc::trailing_bytes );

  return t;
}

} // namespace offchain::storage

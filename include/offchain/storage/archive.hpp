#pragma once

#include <offchain/encode/error.hpp>
#include <offchain/memory/memory.hpp>
#include <offchain/storage/codec.hpp>

#include <concepts>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

namespace offchain::storage {

/**
 * Table values are written with Boost.Serialization binary archives. A value
 * type is a primitive, a container with a boost/serialization header included
 * where it is declared, or a type with a serialize member.
 *
 * Archives are written without a header or object tracking, so an encoded value
 * is exactly the bytes of its members. The format follows the host's byte order
 * and word sizes.
 */
template< typename T >
concept serializable = std::default_initializable< T > && std::movable< T >;

constexpr unsigned int archive_flags = boost::archive::no_header | boost::archive::no_tracking;

std::error_code make_error_code( const boost::archive::archive_exception& e ) noexcept;

template< serializable T >
bytes serialize_value( const T& t )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, archive_flags );
    oa << t;
  }

  const auto serialized = ss.str();
  auto raw              = std::as_bytes( std::span< const char >( serialized ) );
  return bytes( raw.begin(), raw.end() );
}

/**
 * Decode a complete value. Bytes left over after the value are an error.
 */
template< serializable T >
encode::result< T > deserialize_value( std::span< const std::byte > s )
{
  std::istringstream ss( std::string( memory::pointer_cast< const char* >( s.data() ), s.size() ) );
  T t;

  try
  {
    boost::archive::binary_iarchive ia( ss, archive_flags );
    ia >> t;
  }
  catch( const boost::archive::archive_exception& e )
  {
    return std::unexpected( make_error_code( e ) );
  }
  catch( const std::length_error& )
  {
    return std::unexpected( encode::encode_errc::invalid_length );
  }

  if( ss.peek() != std::istringstream::traits_type::eof() )
    return std::unexpected( encode::encode_errc::trailing_bytes );

  return t;
}

} // namespace offchain::storage

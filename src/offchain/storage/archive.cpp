#include <offchain/storage/archive.hpp>

namespace offchain::storage {

std::error_code make_error_code( const boost::archive::archive_exception& e ) noexcept
{
  switch( e.code )
  {
    case boost::archive::archive_exception::input_stream_error:
    case boost::archive::archive_exception::array_size_too_short:
      return encode::encode_errc::invalid_length;
    default:
      return encode::encode_errc::unknown_variant;
  }
}

} // namespace offchain::storage

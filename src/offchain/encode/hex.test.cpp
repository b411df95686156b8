#include <gtest/gtest.h>

#include <offchain/encode/hex.hpp>

#include <algorithm>
#include <array>

using namespace std::string_view_literals;

constexpr std::array< std::byte, 6 > data{ std::byte{ 4 },
                                           std::byte{ 8 },
                                           std::byte{ 15 },
                                           std::byte{ 16 },
                                           std::byte{ 23 },
                                           std::byte{ 42 } };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  EXPECT_EQ( offchain::encode::to_hex( data ), valid_hex_str );
  EXPECT_EQ( offchain::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = offchain::encode::from_hex( valid_hex_str );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, data ) );

  decoded_data = offchain::encode::from_hex( valid_hex_str.substr( 2 ) );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, data ) );

  decoded_data = offchain::encode::from_hex( "0x04080F10172A"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, data ) );

  decoded_data = offchain::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), offchain::encode::encode_errc::invalid_length );
    EXPECT_EQ( decoded_data.error().message(), "invalid length" );
  }

  decoded_data = offchain::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), offchain::encode::encode_errc::invalid_character );
    EXPECT_STREQ( decoded_data.error().category().name(), "encode" );
  }
}

TEST( hex, decode_array )
{
  auto decoded = offchain::encode::from_hex_array< 6 >( valid_hex_str );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, data );

  auto short_input = offchain::encode::from_hex_array< 7 >( valid_hex_str );
  ASSERT_FALSE( short_input );
  EXPECT_EQ( short_input.error(), offchain::encode::encode_errc::invalid_length );

  auto long_input = offchain::encode::from_hex_array< 5 >( valid_hex_str );
  ASSERT_FALSE( long_input );
  EXPECT_EQ( long_input.error(), offchain::encode::encode_errc::invalid_length );

  auto bad_digit = offchain::encode::from_hex_array< 1 >( "0xzz"sv );
  ASSERT_FALSE( bad_digit );
  EXPECT_EQ( bad_digit.error(), offchain::encode::encode_errc::invalid_character );
}

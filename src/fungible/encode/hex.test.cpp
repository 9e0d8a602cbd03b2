#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>

#include <fungible/encode/hex.hpp>
#include <fungible/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = fungible::encode::to_hex( fungible::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( fungible::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = fungible::encode::from_hex( valid_hex_str );

  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, fungible::memory::as_bytes( data ) ) );

  decoded_data = fungible::encode::from_hex( valid_hex_str.substr( 2 ) );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, fungible::memory::as_bytes( data ) ) );

  decoded_data = fungible::encode::from_hex( "0x04080F10172A"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, fungible::memory::as_bytes( data ) ) );

  decoded_data = fungible::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = fungible::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), fungible::encode::encode_errc::invalid_length );
    EXPECT_EQ( decoded_data.error().message(), "unexpected number of hex digits" );
  }

  decoded_data = fungible::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), fungible::encode::encode_errc::invalid_character );
    EXPECT_EQ( decoded_data.error().message(), "invalid hex digit" );
  }
}

TEST( hex, decode_fixed_width )
{
  std::array< std::byte, 6 > out{};

  EXPECT_FALSE( fungible::encode::from_hex( valid_hex_str, out ) );
  EXPECT_TRUE( std::ranges::equal( out, fungible::memory::as_bytes( data ) ) );

  std::array< std::byte, 4 > short_out{};
  EXPECT_EQ( fungible::encode::from_hex( valid_hex_str, short_out ), fungible::encode::encode_errc::invalid_length );

  std::array< std::byte, 2 > untouched{ std::byte{ 0xaa }, std::byte{ 0xbb } };
  EXPECT_EQ( fungible::encode::from_hex( "0x01zz"sv, untouched ), fungible::encode::encode_errc::invalid_character );
  EXPECT_EQ( untouched[ 0 ], std::byte{ 0xaa } );
  EXPECT_EQ( untouched[ 1 ], std::byte{ 0xbb } );
}

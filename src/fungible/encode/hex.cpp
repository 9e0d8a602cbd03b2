#include <fungible/encode/hex.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace fungible::encode {

namespace {

constexpr std::string_view hex_prefix = "0x";
constexpr std::string_view digits     = "0123456789abcdef";
constexpr std::uint8_t hex_offset     = 10;

result< std::uint8_t > nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_character );
}

std::string_view strip_prefix( std::string_view sv ) noexcept
{
  if( sv.starts_with( hex_prefix ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( hex_prefix.size() );

  return sv;
}

// Expects an even number of digits and room for all of them in `out`
std::error_code decode( std::string_view digits_sv, std::byte* out ) noexcept
{
  for( std::size_t i = 0; i < digits_sv.size(); i += 2 )
  {
    auto high = nibble( digits_sv[ i ] );
    if( !high )
      return high.error();

    auto low = nibble( digits_sv[ i + 1 ] );
    if( !low )
      return low.error();

    *out++ = static_cast< std::byte >( *high << 4 | *low );
  }

  return encode_errc::ok;
}

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str( hex_prefix );
  str.reserve( hex_prefix.size() + 2 * s.size() );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( digits[ value >> 4 ] );
    str.push_back( digits[ value & 0x0f ] );
  }

  return str;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes( sv.size() / 2 );
  if( auto error = decode( sv, bytes.data() ); error )
    return std::unexpected( error );

  return bytes;
}

std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() != 2 * out.size() )
    return encode_errc::invalid_length;

  std::vector< std::byte > bytes( out.size() );
  if( auto error = decode( sv, bytes.data() ); error )
    return error;

  std::ranges::copy( bytes, out.begin() );
  return encode_errc::ok;
}

} // namespace fungible::encode

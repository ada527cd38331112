#include <ducat/encode/hex.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

namespace ducat::encode {

struct _hex_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "hex";
  }

  std::string message( int condition ) const noexcept final
  {
    using namespace std::string_literals;
    switch( static_cast< hex_errc >( condition ) )
    {
      case hex_errc::ok:
        return "ok"s;
      case hex_errc::missing_prefix:
        return "expected a 0x prefix"s;
      case hex_errc::invalid_digit:
        return "invalid hex digit"s;
      case hex_errc::length_mismatch:
        return "hex string does not have the expected length"s;
    }
    std::unreachable();
  }
};

const std::error_category& hex_category() noexcept
{
  static _hex_category category;
  return category;
}

std::error_code make_error_code( hex_errc e )
{
  return std::error_code( static_cast< int >( e ), hex_category() );
}

namespace {

constexpr std::string_view prefix = "0x";
constexpr std::string_view digits = "0123456789abcdef";

constexpr std::optional< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );

  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + 10 );

  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + 10 );

  return {};
}

} // namespace

std::string to_hex( std::span< const std::byte > bytes )
{
  std::string str( prefix );
  str.reserve( prefix.size() + bytes.size() * 2 );

  for( auto b: bytes )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( digits[ value >> 4 ] );
    str.push_back( digits[ value & 0x0f ] );
  }

  return str;
}

std::error_code from_hex( std::string_view str, std::span< std::byte > out ) noexcept
{
  if( !str.starts_with( prefix ) )
    return hex_errc::missing_prefix;

  str.remove_prefix( prefix.size() );

  if( str.size() != out.size() * 2 )
    return hex_errc::length_mismatch;

  for( std::size_t i = 0; i < str.size(); i += 2 )
    if( !nibble( str[ i ] ) || !nibble( str[ i + 1 ] ) )
      return hex_errc::invalid_digit;

  for( std::size_t i = 0; i < out.size(); ++i )
    out[ i ] = std::byte( *nibble( str[ 2 * i ] ) << 4 | *nibble( str[ 2 * i + 1 ] ) );

  return hex_errc::ok;
}

} // namespace ducat::encode

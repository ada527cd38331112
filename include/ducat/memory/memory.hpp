#pragma once

#include <cstring>
#include <memory>
#include <ranges>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace ducat::memory {

template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

/**
 * Reads a T from the front of a program output buffer.
 *
 * Throws if the buffer holds fewer than sizeof( T ) bytes.
 */
template< typename T >
  requires( std::is_trivially_copyable_v< T > )
T bit_cast( std::span< const std::byte > bytes )
{
  if( bytes.size() < sizeof( T ) )
    throw std::runtime_error( "byte span is too small" );

  T t;
  std::memcpy( &t, bytes.data(), sizeof( T ) );
  return t;
}

// Contiguous ranges (accounts, strings, buffers) are viewed element-wise,
// everything else as a single trivially copyable value.

template< std::ranges::contiguous_range T >
std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( t ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( std::addressof( t ), 1 ) );
}

template< std::ranges::contiguous_range T >
std::span< std::byte > as_writable_bytes( T& t )
{
  return std::as_writable_bytes( std::span( t ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
std::span< std::byte > as_writable_bytes( T& t )
{
  return std::as_writable_bytes( std::span( std::addressof( t ), 1 ) );
}

} // namespace ducat::memory

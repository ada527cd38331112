#include <ducat/host/call_context.hpp>

#include <algorithm>
#include <utility>

namespace ducat::host {

call_context::call_context( const protocol::account& caller, std::vector< std::byte >&& input ) noexcept:
    _caller( caller ),
    _stdin( std::move( input ) )
{}

std::error_code call_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != program::file_descriptor::stdout )
    return program::program_errc::invalid_argument;

  _stdout.insert( _stdout.end(), buffer.begin(), buffer.end() );
  return program::program_errc::ok;
}

std::error_code call_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return program::program_errc::invalid_argument;

  if( remaining_input() < buffer.size() )
    return program::program_errc::invalid_argument;

  auto first = _stdin.begin() + static_cast< std::ptrdiff_t >( _stdin_offset );
  std::copy( first, first + static_cast< std::ptrdiff_t >( buffer.size() ), buffer.begin() );
  _stdin_offset += buffer.size();

  return program::program_errc::ok;
}

const protocol::account& call_context::get_caller()
{
  return _caller;
}

const std::vector< std::byte >& call_context::output() const noexcept
{
  return _stdout;
}

std::size_t call_context::remaining_input() const noexcept
{
  return _stdin.size() - _stdin_offset;
}

} // namespace ducat::host

#pragma once

#include <cstddef>
#include <vector>

#include <ducat/program/system_interface.hpp>
#include <ducat/protocol/account.hpp>

namespace ducat::host {

/**
 * Buffers the input and output of a single program call made on behalf of an
 * authenticated caller.
 */
class call_context final: public program::system_interface
{
public:
  call_context( const protocol::account& caller, std::vector< std::byte >&& input ) noexcept;
  ~call_context() final = default;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;
  const protocol::account& get_caller() final;

  const std::vector< std::byte >& output() const noexcept;
  std::size_t remaining_input() const noexcept;

private:
  protocol::account _caller;
  std::vector< std::byte > _stdin;
  std::size_t _stdin_offset = 0;
  std::vector< std::byte > _stdout;
};

} // namespace ducat::host

#pragma once

#include <span>
#include <system_error>

#include <ducat/program/error.hpp>
#include <ducat/protocol/account.hpp>

namespace ducat::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout
};

/**
 * What the host exposes to a running program.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  /**
   * Fills the whole buffer or fails without consuming input.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer ) = 0;

  /**
   * The authenticated identity on whose behalf the program runs.
   */
  virtual const protocol::account& get_caller() = 0;
};

} // namespace ducat::program

#pragma once

#include <system_error>

#include <ducat/program/system_interface.hpp>

namespace ducat::program {

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system ) = 0;
};

} // namespace ducat::program

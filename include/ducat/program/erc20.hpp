#pragma once

#include <cstdint>
#include <string>

#include <ducat/program/error.hpp>
#include <ducat/program/program.hpp>
#include <ducat/token/ledger.hpp>

namespace ducat::program {

/**
 * Decodes one instruction from stdin and runs it against the token ledger.
 *
 * The instruction word, amounts and string lengths are little endian. Queries
 * answer on stdout. Token failures are returned as token error codes, an
 * over-long issue name or ticker included.
 */
struct erc20 final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    issue,
    transfer,
    approve,
    transfer_from,
    name,
    ticker,
    total_supply,
    balance_of,
    allowance
  };

  explicit erc20( token::ledger& l ) noexcept;
  erc20( const erc20& ) = delete;
  erc20( erc20&& )      = delete;
  ~erc20() override     = default;

  erc20& operator=( const erc20& ) = delete;
  erc20& operator=( erc20&& )      = delete;

  std::error_code run( system_interface* system ) override;

private:
  token::ledger& _ledger;
};

} // namespace ducat::program

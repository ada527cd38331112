#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace ducat::token {

using amount = std::uint64_t;

constexpr std::size_t max_name_size   = 64;
constexpr std::size_t max_ticker_size = 32;

struct token
{
  std::string name;
  std::string ticker;
  amount total_supply = 0;

  bool operator==( const token& ) const = default;
};

enum class reissue_policy : std::uint_fast8_t
{
  forbid,
  overwrite
};

struct config
{
  /**
   * Under overwrite a repeated issue replaces the token record and resets the
   * issuer's balance without touching other holders, which does not conserve
   * supply. It exists only for compatibility with deployments that relied on it.
   */
  reissue_policy reissue = reissue_policy::forbid;
};

constexpr std::optional< amount > checked_add( amount a, amount b ) noexcept
{
  if( std::numeric_limits< amount >::max() - a < b )
    return {};

  return a + b;
}

constexpr std::optional< amount > checked_sub( amount a, amount b ) noexcept
{
  if( a < b )
    return {};

  return a - b;
}

} // namespace ducat::token

#pragma once

#include <expected>
#include <system_error>

namespace ducat::token {

enum class token_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  name_too_long,
  ticker_too_long,
  already_issued,
  insufficient_balance,
  insufficient_allowance,
  overflow
};

const std::error_category& token_category() noexcept;

std::error_code make_error_code( token_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace ducat::token

template<>
struct std::is_error_code_enum< ducat::token::token_errc >: public std::true_type
{};

#include <ducat/token/error.hpp>

#include <string>
#include <utility>

namespace ducat::token {

struct _token_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "token";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< token_errc >( condition ) )
    {
      case token_errc::ok:
        return "ok"s;
      case token_errc::name_too_long:
        return "token name cannot exceed 64 bytes"s;
      case token_errc::ticker_too_long:
        return "token ticker cannot exceed 32 bytes"s;
      case token_errc::already_issued:
        return "token has already been issued"s;
      case token_errc::insufficient_balance:
        return "insufficient balance"s;
      case token_errc::insufficient_allowance:
        return "insufficient allowance"s;
      case token_errc::overflow:
        return "arithmetic overflow"s;
    }
    std::unreachable();
  }
};

const std::error_category& token_category() noexcept
{
  static _token_category category;
  return category;
}

std::error_code make_error_code( token_errc e )
{
  return std::error_code( static_cast< int >( e ), token_category() );
}

} // namespace ducat::token

#include <ducat/protocol/account.hpp>

#include <algorithm>

#include <ducat/memory.hpp>

namespace ducat::protocol {

std::optional< account > make_account( std::string_view label ) noexcept
{
  if( label.size() > account_size )
    return {};

  account acc{};
  std::ranges::copy( memory::as_bytes( label ), acc.begin() );
  return acc;
}

} // namespace ducat::protocol

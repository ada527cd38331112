#include <ducat/protocol/event.hpp>

namespace ducat::protocol {

std::string_view event_name( const event& e ) noexcept
{
  using namespace std::string_view_literals;

  struct visitor
  {
    std::string_view operator()( const transfer_event& ) const noexcept
    {
      return "transfer"sv;
    }

    std::string_view operator()( const approval_event& ) const noexcept
    {
      return "approval"sv;
    }
  };

  return std::visit( visitor{}, e );
}

} // namespace ducat::protocol

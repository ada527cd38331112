#include <ducat/token/event_sink.hpp>

namespace ducat::token {

void event_log::record( const protocol::event& e )
{
  _events.push_back( e );
}

const std::vector< protocol::event >& event_log::events() const noexcept
{
  return _events;
}

void event_log::clear() noexcept
{
  _events.clear();
}

} // namespace ducat::token

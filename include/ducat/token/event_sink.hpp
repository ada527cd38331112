#pragma once

#include <vector>

#include <ducat/protocol/event.hpp>

namespace ducat::token {

/**
 * Host facility receiving the events of committed operations.
 */
struct event_sink
{
  event_sink()                    = default;
  event_sink( const event_sink& ) = delete;
  event_sink( event_sink&& )      = delete;
  virtual ~event_sink()           = default;

  event_sink& operator=( const event_sink& ) = delete;
  event_sink& operator=( event_sink&& )      = delete;

  virtual void record( const protocol::event& e ) = 0;
};

/**
 * In-memory event sink keeping events in emission order.
 */
class event_log final: public event_sink
{
public:
  void record( const protocol::event& e ) final;

  const std::vector< protocol::event >& events() const noexcept;
  void clear() noexcept;

private:
  std::vector< protocol::event > _events;
};

} // namespace ducat::token

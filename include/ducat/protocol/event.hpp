#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <variant>

#include <boost/serialization/split_free.hpp>

#include <ducat/protocol/account.hpp>

namespace ducat::protocol {

struct transfer_event
{
  account from{};
  account to{};
  std::uint64_t value = 0;

  bool operator==( const transfer_event& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & to;
    ar & value;
  }
};

/**
 * Approval carries the amount added by an approve or the amount consumed by a
 * delegated transfer, never the resulting allowance.
 */
struct approval_event
{
  account owner{};
  account spender{};
  std::uint64_t value = 0;

  bool operator==( const approval_event& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & spender;
    ar & value;
  }
};

using event = std::variant< transfer_event, approval_event >;

std::string_view event_name( const event& e ) noexcept;

} // namespace ducat::protocol

namespace boost { namespace serialization {

template< class Archive >
void save( Archive& ar, const ducat::protocol::event& e, const unsigned int version )
{
  std::uint32_t which = e.index();
  ar << which;
  std::visit(
    [ & ]( const auto& alternative )
    {
      ar << alternative;
    },
    e );
}

template< class Archive >
void load( Archive& ar, ducat::protocol::event& e, const unsigned int version )
{
  std::uint32_t which = 0;
  ar >> which;

  switch( which )
  {
    case 0:
      {
        ducat::protocol::transfer_event t;
        ar >> t;
        e = t;
        break;
      }
    case 1:
      {
        ducat::protocol::approval_event a;
        ar >> a;
        e = a;
        break;
      }
    default:
      throw std::runtime_error( "unknown event type in archive" );
  }
}

template< class Archive >
void serialize( Archive& ar, ducat::protocol::event& e, const unsigned int version )
{
  split_free( ar, e, version );
}

}} // namespace boost::serialization

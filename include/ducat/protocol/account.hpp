#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

#include <boost/serialization/array_wrapper.hpp>

namespace ducat::protocol {

constexpr std::size_t account_size = 32;

/**
 * Opaque account identity as supplied by the host's authentication layer.
 */
struct account: std::array< std::byte, account_size >
{
  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar& boost::serialization::make_array( data(), size() );
  }
};

/**
 * Builds an account from a short label, zero padded. Labels longer than
 * account_size bytes are rejected.
 */
std::optional< account > make_account( std::string_view label ) noexcept;

} // namespace ducat::protocol

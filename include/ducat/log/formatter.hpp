#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <ducat/encode/hex.hpp>

namespace ducat::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace ducat::log

template<>
struct fmtquill::formatter< ducat::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const ducat::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                ducat::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< ducat::log::hex >: quill::BinaryDataDeferredFormatCodec< ducat::log::hex >
{};

#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <fungible/encode/hex.hpp>

namespace fungible::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace fungible::log

template<>
struct fmtquill::formatter< fungible::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const fungible::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                fungible::encode::to_hex( std::as_bytes( std::span( bin_data.data(), bin_data.size() ) ) ) );
  }
};

template<>
struct quill::Codec< fungible::log::hex >: quill::BinaryDataDeferredFormatCodec< fungible::log::hex >
{};

#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <offchain/encode/hex.hpp>
#include <offchain/storage/column.hpp>

namespace offchain::log {

struct hex_tag
{};

// Raw key or value bytes, printed as 0x prefixed hex.
using hex = quill::BinaryData< hex_tag >;

} // namespace offchain::log

template<>
struct fmtquill::formatter< offchain::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const offchain::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                offchain::encode::to_hex( std::as_bytes( std::span( bin_data.data(), bin_data.size() ) ) ) );
  }
};

template<>
struct quill::Codec< offchain::log::hex >: quill::BinaryDataDeferredFormatCodec< offchain::log::hex >
{};

template<>
struct fmtquill::formatter< offchain::storage::column >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( offchain::storage::column c, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}({})", offchain::storage::column_name( c ), offchain::storage::column_id( c ) );
  }
};

template<>
struct quill::Codec< offchain::storage::column >: quill::DeferredFormatCodec< offchain::storage::column >
{};

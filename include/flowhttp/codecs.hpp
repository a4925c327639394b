#pragma once

#include "codec.hpp"
#include "json_codec.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace flowhttp
{

// =================================================================================================

/// Upper bound for the size of a single body chunk produced by the built-in encoders.
inline constexpr std::size_t default_chunk_size = 16 * 1024;

// =================================================================================================

/// Raw bytes, for any media type.
class BytesEncoder final : public Encoder
{
public:
   explicit BytesEncoder(std::size_t chunk_size = default_chunk_size);

   std::string_view name() const noexcept override { return "bytes"; }
   bool can_encode(std::type_index type, const MediaType& media_type) const override;
   ByteStream encode(ValueStream values, std::type_index type,
                     const MediaType& media_type) const override;
   MediaType default_media_type() const override { return MediaType::application_octet_stream(); }

private:
   std::size_t m_chunk_size;
};

/// Raw bytes, for any media type. Every chunk received is passed on as a separate element.
class BytesDecoder final : public Decoder
{
public:
   std::string_view name() const noexcept override { return "bytes"; }
   bool can_decode(std::type_index type, const MediaType& media_type,
                   const Hints& hints) const override;
   ValueStream decode(ByteStream bytes, std::type_index type, const MediaType& media_type,
                      const Hints& hints) const override;
};

// -------------------------------------------------------------------------------------------------

/**
 * \c std::string as \c text/plain. Strings are UTF-8, a \c charset parameter of ISO-8859-1 or
 * US-ASCII is converted on the fly. Other character sets are not supported.
 */
class StringEncoder final : public Encoder
{
public:
   explicit StringEncoder(std::size_t chunk_size = default_chunk_size);

   std::string_view name() const noexcept override { return "string"; }
   bool can_encode(std::type_index type, const MediaType& media_type) const override;
   ByteStream encode(ValueStream values, std::type_index type,
                     const MediaType& media_type) const override;
   MediaType default_media_type() const override;

private:
   std::size_t m_chunk_size;
};

/**
 * \c std::string from \c text/plain. The whole body is joined into a single string, an empty body
 * yields no element at all. The character set is taken from the media type, falling back to the
 * one passed in the hints.
 */
class StringDecoder final : public Decoder
{
public:
   std::string_view name() const noexcept override { return "string"; }
   bool can_decode(std::type_index type, const MediaType& media_type,
                   const Hints& hints) const override;
   ValueStream decode(ByteStream bytes, std::type_index type, const MediaType& media_type,
                      const Hints& hints) const override;
};

// =================================================================================================

using Encoders = std::vector<std::shared_ptr<const Encoder>>;
using Decoders = std::vector<std::shared_ptr<const Decoder>>;

/**
 * The default encoders, most specific first: bytes, string, JSON.
 *
 * Custom lists should keep that discipline, as negotiation picks the first match.
 */
Encoders default_encoders(std::shared_ptr<const JsonTypes> json_types = {},
                          std::size_t chunk_size = default_chunk_size);

/// The default decoders, most specific first: bytes, string, JSON.
Decoders default_decoders(std::shared_ptr<const JsonTypes> json_types = {});

// =================================================================================================

} // namespace flowhttp

#pragma once

#include "media_type.hpp"
#include "stream.hpp"

#include <any>
#include <string>
#include <string_view>
#include <typeindex>

namespace flowhttp
{

// =================================================================================================

/// Type-erased sequence of values, as consumed by encoders and produced by decoders.
using ValueStream = Stream<std::any>;

/**
 * Auxiliary hints passed to decoders. The engine always passes the transmission character
 * encoding assumption, which is UTF-8.
 */
struct Hints
{
   std::string charset = "UTF-8";

   /// Set when the body is consumed as a stream. Decoders of formats with a top-level array may
   /// then produce its elements one by one instead of the array as a single value.
   bool stream_array_elements = false;
};

// =================================================================================================

/**
 * Encodes typed values into a byte stream.
 *
 * Encoders are shared read-only between concurrent requests, so implementations must not have
 * mutable state.
 */
class Encoder
{
public:
   virtual ~Encoder() = default;

   virtual std::string_view name() const noexcept = 0;

   /// \p media_type is the declared \c Content-Type of the request, or "*\/*" if there is none.
   virtual bool can_encode(std::type_index type, const MediaType& media_type) const = 0;

   virtual ByteStream encode(ValueStream values, std::type_index type,
                             const MediaType& media_type) const = 0;

   /// Used as \c Content-Type when the request did not declare one.
   virtual MediaType default_media_type() const = 0;
};

// -------------------------------------------------------------------------------------------------

/**
 * Decodes a byte stream into a lazy sequence of typed values.
 *
 * The sequence may contain any number of elements, and the decoder should not pull more bytes
 * than required to produce the next element.
 */
class Decoder
{
public:
   virtual ~Decoder() = default;

   virtual std::string_view name() const noexcept = 0;

   virtual bool can_decode(std::type_index type, const MediaType& media_type,
                           const Hints& hints) const = 0;

   virtual ValueStream decode(ByteStream bytes, std::type_index type, const MediaType& media_type,
                              const Hints& hints) const = 0;
};

// =================================================================================================

} // namespace flowhttp

#pragma once

#include "codecs.hpp"

namespace flowhttp
{

// =================================================================================================

/**
 * Ordered lists of encoders and decoders, and the negotiation between them.
 *
 * Resolution walks the list in registration order and picks the first codec that accepts the
 * given type and media type. The registry is immutable once constructed.
 */
class CodecRegistry
{
public:
   CodecRegistry(Encoders encoders, Decoders decoders);

   /// Returns the first matching encoder, or \c nullptr.
   const Encoder* resolve_encoder(std::type_index type, const MediaType& media_type) const;

   /// Returns the first matching decoder, or \c nullptr.
   const Decoder* resolve_decoder(std::type_index type, const MediaType& media_type,
                                  const Hints& hints) const;

   const Encoders& encoders() const noexcept { return m_encoders; }
   const Decoders& decoders() const noexcept { return m_decoders; }

private:
   Encoders m_encoders;
   Decoders m_decoders;
};

// =================================================================================================

} // namespace flowhttp

#include "flowhttp/codec_registry.hpp"

#include <algorithm>

namespace flowhttp
{

// =================================================================================================

CodecRegistry::CodecRegistry(Encoders encoders, Decoders decoders)
   : m_encoders(std::move(encoders)), m_decoders(std::move(decoders))
{
   std::erase(m_encoders, nullptr);
   std::erase(m_decoders, nullptr);
}

const Encoder* CodecRegistry::resolve_encoder(std::type_index type,
                                              const MediaType& media_type) const
{
   auto it = std::ranges::find_if(m_encoders, [&](const auto& encoder)
                                  { return encoder->can_encode(type, media_type); });
   if (it == m_encoders.end())
   {
      logd("CodecRegistry: no encoder for {} as {}", type.name(), media_type.to_string());
      return nullptr;
   }

   logd("CodecRegistry: encoding {} as {} with '{}'", type.name(), media_type.to_string(),
        (*it)->name());
   return it->get();
}

const Decoder* CodecRegistry::resolve_decoder(std::type_index type, const MediaType& media_type,
                                              const Hints& hints) const
{
   auto it = std::ranges::find_if(m_decoders, [&](const auto& decoder)
                                  { return decoder->can_decode(type, media_type, hints); });
   if (it == m_decoders.end())
   {
      logd("CodecRegistry: no decoder for {} from {}", type.name(), media_type.to_string());
      return nullptr;
   }

   logd("CodecRegistry: decoding {} from {} with '{}'", type.name(), media_type.to_string(),
        (*it)->name());
   return it->get();
}

// =================================================================================================

} // namespace flowhttp

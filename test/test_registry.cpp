#include "flowhttp/codec_registry.hpp"

#include "test_types.hpp"

#include <gtest/gtest.h>

using namespace flowhttp;
using namespace flowhttp::test;

// =================================================================================================

namespace
{

/// Accepts a fixed type for media types compatible with a fixed one, never actually encodes.
class FakeEncoder : public Encoder
{
public:
   FakeEncoder(std::string name, std::type_index type, MediaType media_type)
      : m_name(std::move(name)), m_type(type), m_media_type(std::move(media_type))
   {
   }

   std::string_view name() const noexcept override { return m_name; }
   bool can_encode(std::type_index type, const MediaType& media_type) const override
   {
      return type == m_type && m_media_type.is_compatible_with(media_type);
   }
   ByteStream encode(ValueStream, std::type_index, const MediaType&) const override
   {
      return ByteStream::empty();
   }
   MediaType default_media_type() const override { return m_media_type; }

private:
   std::string m_name;
   std::type_index m_type;
   MediaType m_media_type;
};

class FakeDecoder : public Decoder
{
public:
   FakeDecoder(std::string name, std::type_index type, MediaType media_type)
      : m_name(std::move(name)), m_type(type), m_media_type(std::move(media_type))
   {
   }

   std::string_view name() const noexcept override { return m_name; }
   bool can_decode(std::type_index type, const MediaType& media_type, const Hints&) const override
   {
      return type == m_type && m_media_type.is_compatible_with(media_type);
   }
   ValueStream decode(ByteStream, std::type_index, const MediaType&, const Hints&) const override
   {
      return ValueStream::empty();
   }

private:
   std::string m_name;
   std::type_index m_type;
   MediaType m_media_type;
};

std::string_view name_of(const Encoder* encoder) { return encoder ? encoder->name() : "none"; }
std::string_view name_of(const Decoder* decoder) { return decoder ? decoder->name() : "none"; }

} // namespace

// =================================================================================================

class Registry : public testing::Test
{
protected:
   std::shared_ptr<const Encoder> text_any =
      std::make_shared<FakeEncoder>("text-any", typeid(std::string), MediaType::all());
   std::shared_ptr<const Encoder> text_plain =
      std::make_shared<FakeEncoder>("text-plain", typeid(std::string), MediaType::text_plain());
   std::shared_ptr<const Encoder> json =
      std::make_shared<FakeEncoder>("json", typeid(Pojo), MediaType::application_json());
};

TEST_F(Registry, FirstMatchWins)
{
   CodecRegistry registry({text_any, text_plain, json}, {});
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(std::string), MediaType::text_plain())),
             "text-any");
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(Pojo), MediaType::application_json())),
             "json");
}

TEST_F(Registry, OrderOnlyAffectsTies)
{
   CodecRegistry registry({text_plain, json, text_any}, {});
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(std::string), MediaType::text_plain())),
             "text-plain");
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(std::string), MediaType::application_xml())),
             "text-any");
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(Pojo), MediaType::application_json())),
             "json");
}

TEST_F(Registry, Deterministic)
{
   CodecRegistry registry({text_any, text_plain, json}, {});
   auto first = registry.resolve_encoder(typeid(std::string), MediaType::text_plain());
   for (int i = 0; i < 10; ++i)
      EXPECT_EQ(registry.resolve_encoder(typeid(std::string), MediaType::text_plain()), first);
}

TEST_F(Registry, NoMatch)
{
   CodecRegistry registry({text_plain, json}, {});
   EXPECT_EQ(registry.resolve_encoder(typeid(int), MediaType::all()), nullptr);
   EXPECT_EQ(registry.resolve_encoder(typeid(Pojo), MediaType::application_xml()), nullptr);
   EXPECT_EQ(registry.resolve_decoder(typeid(Pojo), MediaType::application_json(), {}), nullptr);
}

TEST_F(Registry, IgnoresNullEntries)
{
   CodecRegistry registry({nullptr, json, nullptr}, {nullptr});
   EXPECT_EQ(registry.encoders().size(), 1);
   EXPECT_TRUE(registry.decoders().empty());
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(Pojo), MediaType::all())), "json");
}

TEST_F(Registry, Decoders)
{
   CodecRegistry registry(
      {}, {std::make_shared<FakeDecoder>("xml", typeid(Pojo), MediaType::application_xml()),
           std::make_shared<FakeDecoder>("json", typeid(Pojo), MediaType::application_json()),
           std::make_shared<FakeDecoder>("fallback", typeid(Pojo), MediaType::all())});

   EXPECT_EQ(name_of(registry.resolve_decoder(typeid(Pojo), MediaType::application_json(), {})),
             "json");
   EXPECT_EQ(name_of(registry.resolve_decoder(typeid(Pojo), MediaType::application_xml(), {})),
             "xml");
   EXPECT_EQ(name_of(registry.resolve_decoder(typeid(Pojo), MediaType::text_plain(), {})),
             "fallback");
}

TEST_F(Registry, Defaults)
{
   auto types = std::make_shared<JsonTypes>();
   types->add<Pojo>();
   CodecRegistry registry(default_encoders(types), default_decoders(types));

   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(Bytes), MediaType::application_json())),
             "bytes");
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(std::string), MediaType::all())), "string");
   EXPECT_EQ(name_of(registry.resolve_encoder(typeid(Pojo), MediaType::all())), "json");
   EXPECT_EQ(name_of(registry.resolve_decoder(typeid(std::string), MediaType::text_plain(), {})),
             "string");
   EXPECT_EQ(name_of(registry.resolve_decoder(typeid(Pojo), MediaType::application_json(), {})),
             "json");
   EXPECT_EQ(registry.resolve_decoder(typeid(Pojo), MediaType::application_xml(), {}), nullptr);
}

// =================================================================================================

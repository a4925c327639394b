#include "flowhttp/detail/json_splitter.hpp"
#include "flowhttp/error.hpp"
#include "flowhttp/json_codec.hpp"

#include <json/reader.h>
#include <json/writer.h>

#include <format>
#include <tuple>

namespace flowhttp
{

// =================================================================================================

namespace
{
const std::type_index json_value_type = typeid(Json::Value);

bool is_json(const MediaType& media_type)
{
   static const MediaType json = MediaType::application_json();
   static const MediaType any_json{"application", "*+json"};
   return json.is_compatible_with(media_type) || any_json.is_compatible_with(media_type);
}

Json::Value parse(const std::string& text)
{
   Json::CharReaderBuilder builder;
   builder["collectComments"] = false;
   builder["allowTrailingCommas"] = false;
   builder["failIfExtra"] = true;
   std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

   Json::Value result;
   std::string errors;
   if (!reader->parse(text.data(), text.data() + text.size(), &result, &errors))
      throw_error(error::decoding_failed, std::format("invalid JSON: {}", errors));
   return result;
}

// -------------------------------------------------------------------------------------------------

/**
 * Pulls byte chunks until the splitter has produced at least one complete value.
 */
class JsonValueSource : public Source<std::any>
{
public:
   JsonValueSource(ByteStream bytes, std::shared_ptr<const JsonTypes> types, std::type_index type,
                   bool stream_arrays)
      : m_bytes(std::move(bytes)), m_types(std::move(types)), m_type(type),
        m_splitter(stream_arrays)
   {
   }

   awaitable<std::optional<std::any>> next() override
   {
      while (m_pending.empty() && !m_finished)
      {
         auto chunk = co_await m_bytes.next();
         if (chunk)
            m_splitter.feed(make_string_view(*chunk), m_pending);
         else
         {
            m_splitter.finish(m_pending);
            m_finished = true;
         }
      }

      if (m_pending.empty())
         co_return std::nullopt;

      auto text = std::move(m_pending.front());
      m_pending.erase(m_pending.begin());
      logd("JsonDecoder: decoded value of {} bytes", text.size());

      auto json = parse(text);
      if (m_type == json_value_type)
         co_return std::any(std::move(json));

      try
      {
         co_return m_types->read(json, m_type);
      }
      catch (const Json::Exception& ex)
      {
         throw_error(error::decoding_failed, std::format("JSON mapping failed: {}", ex.what()));
      }
   }

private:
   ByteStream m_bytes;
   std::shared_ptr<const JsonTypes> m_types;
   std::type_index m_type;
   detail::JsonSplitter m_splitter;
   std::vector<std::string> m_pending;
   bool m_finished = false;
};

} // namespace

// =================================================================================================

bool JsonTypes::contains(std::type_index type) const
{
   return type == json_value_type || m_mappings.contains(type);
}

Json::Value JsonTypes::write(const std::any& value, std::type_index type) const
{
   if (type == json_value_type)
      return std::any_cast<const Json::Value&>(value);

   auto it = m_mappings.find(type);
   if (it == m_mappings.end())
      throw_error(error::unsupported_content, std::format("no JSON mapping for {}", type.name()));
   return it->second.write(value);
}

std::any JsonTypes::read(const Json::Value& json, std::type_index type) const
{
   if (type == json_value_type)
      return json;

   auto it = m_mappings.find(type);
   if (it == m_mappings.end())
      throw_error(error::unsupported_content, std::format("no JSON mapping for {}", type.name()));
   return it->second.read(json);
}

std::string to_canonical_json(const Json::Value& json)
{
   Json::StreamWriterBuilder builder;
   builder["indentation"] = "";
   builder["emitUTF8"] = true;
   return Json::writeString(builder, json);
}

// =================================================================================================

JsonEncoder::JsonEncoder(std::shared_ptr<const JsonTypes> types)
   : m_types(types ? std::move(types) : std::make_shared<const JsonTypes>())
{
}

bool JsonEncoder::can_encode(std::type_index type, const MediaType& media_type) const
{
   return m_types->contains(type) && is_json(media_type);
}

ByteStream JsonEncoder::encode(ValueStream values, std::type_index type,
                               const MediaType& media_type) const
{
   return std::move(values).map([types = m_types, type](std::any value)
   {
      auto text = to_canonical_json(types->write(value, type));
      logd("JsonEncoder: encoded {} bytes", text.size());
      return make_bytes(text);
   });
}

// -------------------------------------------------------------------------------------------------

JsonDecoder::JsonDecoder(std::shared_ptr<const JsonTypes> types)
   : m_types(types ? std::move(types) : std::make_shared<const JsonTypes>())
{
}

bool JsonDecoder::can_decode(std::type_index type, const MediaType& media_type,
                             const Hints& hints) const
{
   std::ignore = hints; // JSON is always UTF-8 (RFC 8259)
   return m_types->contains(type) && is_json(media_type);
}

ValueStream JsonDecoder::decode(ByteStream bytes, std::type_index type,
                                const MediaType& media_type, const Hints& hints) const
{
   return ValueStream(std::make_unique<JsonValueSource>(std::move(bytes), m_types, type,
                                                        hints.stream_array_elements));
}

// =================================================================================================

} // namespace flowhttp

#include "flowhttp/codecs.hpp"
#include "flowhttp/error.hpp"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/chunk.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace flowhttp
{

// =================================================================================================

namespace
{
const std::type_index bytes_type = typeid(Bytes);
const std::type_index string_type = typeid(std::string);

std::vector<Bytes> split(const Bytes& bytes, std::size_t chunk_size)
{
   std::vector<Bytes> chunks;
   for (auto chunk : bytes | ranges::views::chunk(chunk_size))
      chunks.push_back(chunk | ranges::to<Bytes>());
   return chunks;
}

// -------------------------------------------------------------------------------------------------

enum class Charset
{
   utf8,
   latin1
};

std::optional<Charset> parse_charset(std::string_view name)
{
   std::string lower(name);
   std::ranges::transform(lower, lower.begin(),
                          [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

   // US-ASCII is a subset of UTF-8
   if (lower == "utf-8" || lower == "utf8" || lower == "us-ascii" || lower == "ascii")
      return Charset::utf8;
   if (lower == "iso-8859-1" || lower == "latin1" || lower == "iso_8859-1")
      return Charset::latin1;
   return std::nullopt;
}

std::optional<Charset> charset_of(const MediaType& media_type, std::string_view fallback)
{
   if (auto charset = media_type.charset())
      return parse_charset(*charset);
   return parse_charset(fallback);
}

std::string latin1_to_utf8(std::string_view str)
{
   std::string result;
   result.reserve(str.size());
   for (unsigned char c : str)
   {
      if (c < 0x80)
         result.push_back(static_cast<char>(c));
      else
      {
         result.push_back(static_cast<char>(0xc0 | (c >> 6)));
         result.push_back(static_cast<char>(0x80 | (c & 0x3f)));
      }
   }
   return result;
}

/// Code points that cannot be represented in ISO-8859-1 are replaced by '?'.
std::string utf8_to_latin1(std::string_view str)
{
   std::string result;
   result.reserve(str.size());
   for (size_t i = 0; i < str.size();)
   {
      const auto c = static_cast<unsigned char>(str[i]);
      size_t length = 1;
      uint32_t code_point = c;
      if (c >= 0xf0)
         length = 4, code_point = c & 0x07;
      else if (c >= 0xe0)
         length = 3, code_point = c & 0x0f;
      else if (c >= 0xc0)
         length = 2, code_point = c & 0x1f;

      for (size_t k = 1; k < length && i + k < str.size(); ++k)
         code_point = (code_point << 6) | (static_cast<unsigned char>(str[i + k]) & 0x3f);

      result.push_back(code_point <= 0xff ? static_cast<char>(code_point) : '?');
      i += length;
   }
   return result;
}

// -------------------------------------------------------------------------------------------------

/**
 * Drains the byte stream and emits its content as one string, or nothing if it was empty.
 */
class JoinSource : public Source<std::any>
{
public:
   JoinSource(ByteStream bytes, Charset charset) : m_bytes(std::move(bytes)), m_charset(charset) {}

   awaitable<std::optional<std::any>> next() override
   {
      if (m_done)
         co_return std::nullopt;

      std::string text;
      while (auto chunk = co_await m_bytes.next())
         text.append(make_string_view(*chunk));

      m_done = true;
      logd("StringDecoder: decoded {} bytes", text.size());
      if (text.empty())
         co_return std::nullopt;

      if (m_charset == Charset::latin1)
         text = latin1_to_utf8(text);
      co_return std::any(std::move(text));
   }

private:
   ByteStream m_bytes;
   Charset m_charset;
   bool m_done = false;
};

} // namespace

// =================================================================================================

BytesEncoder::BytesEncoder(std::size_t chunk_size) : m_chunk_size(std::max<size_t>(1, chunk_size))
{
}

bool BytesEncoder::can_encode(std::type_index type, const MediaType& media_type) const
{
   return type == bytes_type;
}

ByteStream BytesEncoder::encode(ValueStream values, std::type_index type,
                                const MediaType& media_type) const
{
   return std::move(values).flat_map([chunk_size = m_chunk_size](std::any value)
   { return split(std::any_cast<const Bytes&>(value), chunk_size); });
}

// -------------------------------------------------------------------------------------------------

bool BytesDecoder::can_decode(std::type_index type, const MediaType& media_type,
                              const Hints& hints) const
{
   return type == bytes_type;
}

ValueStream BytesDecoder::decode(ByteStream bytes, std::type_index type,
                                 const MediaType& media_type, const Hints& hints) const
{
   return std::move(bytes).map([](Bytes chunk) { return std::any(std::move(chunk)); });
}

// =================================================================================================

StringEncoder::StringEncoder(std::size_t chunk_size)
   : m_chunk_size(std::max<size_t>(1, chunk_size))
{
}

bool StringEncoder::can_encode(std::type_index type, const MediaType& media_type) const
{
   return type == string_type && MediaType::text_plain().is_compatible_with(media_type) &&
          charset_of(media_type, "UTF-8").has_value();
}

ByteStream StringEncoder::encode(ValueStream values, std::type_index type,
                                 const MediaType& media_type) const
{
   const auto charset = charset_of(media_type, "UTF-8").value_or(Charset::utf8);
   return std::move(values).flat_map([chunk_size = m_chunk_size, charset](std::any value)
   {
      const auto& text = std::any_cast<const std::string&>(value);
      if (charset == Charset::latin1)
         return split(make_bytes(utf8_to_latin1(text)), chunk_size);
      return split(make_bytes(text), chunk_size);
   });
}

MediaType StringEncoder::default_media_type() const
{
   return MediaType::text_plain().with_parameter("charset", "UTF-8");
}

// -------------------------------------------------------------------------------------------------

bool StringDecoder::can_decode(std::type_index type, const MediaType& media_type,
                               const Hints& hints) const
{
   return type == string_type && MediaType::text_plain().is_compatible_with(media_type) &&
          charset_of(media_type, hints.charset).has_value();
}

ValueStream StringDecoder::decode(ByteStream bytes, std::type_index type,
                                  const MediaType& media_type, const Hints& hints) const
{
   const auto charset = charset_of(media_type, hints.charset);
   if (!charset)
      throw_error(error::unsupported_content,
                  std::format("unsupported charset in '{}'", media_type.to_string()));

   return ValueStream(std::make_unique<JoinSource>(std::move(bytes), *charset));
}

// =================================================================================================

Encoders default_encoders(std::shared_ptr<const JsonTypes> json_types, std::size_t chunk_size)
{
   return {std::make_shared<BytesEncoder>(chunk_size), std::make_shared<StringEncoder>(chunk_size),
           std::make_shared<JsonEncoder>(std::move(json_types))};
}

Decoders default_decoders(std::shared_ptr<const JsonTypes> json_types)
{
   return {std::make_shared<BytesDecoder>(), std::make_shared<StringDecoder>(),
           std::make_shared<JsonDecoder>(std::move(json_types))};
}

// =================================================================================================

} // namespace flowhttp

#include "flowhttp/error.hpp"
#include "flowhttp/request_builder.hpp"
#include "flowhttp/transport.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/url/parse.hpp>

#include <format>

namespace flowhttp
{

namespace http = boost::beast::http;

// =================================================================================================

namespace
{
boost::urls::url parse_target(std::string_view target)
{
   auto result = boost::urls::parse_uri_reference(target);
   if (!result)
      throw_error(error::malformed_target,
                  std::format("invalid target '{}': {}", target, result.error().message()));
   return boost::urls::url(*result);
}
} // namespace

// =================================================================================================

RequestBuilder::RequestBuilder(Method method, std::string_view target)
   : RequestBuilder(method, parse_target(target))
{
}

RequestBuilder::RequestBuilder(Method method, boost::urls::url url)
   : m_method(method), m_url(std::move(url))
{
}

// -------------------------------------------------------------------------------------------------

RequestBuilder& RequestBuilder::header(std::string_view name, std::string_view value)
{
   m_fields.insert(name, value);
   return *this;
}

RequestBuilder& RequestBuilder::header(std::string_view name,
                                       std::initializer_list<std::string_view> values)
{
   for (auto value : values)
      m_fields.insert(name, value);
   return *this;
}

RequestBuilder& RequestBuilder::headers(Fields fields)
{
   m_fields = std::move(fields);
   return *this;
}

RequestBuilder& RequestBuilder::content_type(const MediaType& media_type)
{
   m_fields.set(http::field::content_type, media_type.to_string());
   return *this;
}

RequestBuilder& RequestBuilder::content_type(std::string_view media_type)
{
   return content_type(MediaType::parse_or_throw(media_type));
}

RequestBuilder& RequestBuilder::accept(const MediaType& media_type)
{
   m_fields.set(http::field::accept, media_type.to_string());
   return *this;
}

RequestBuilder& RequestBuilder::accept(std::initializer_list<MediaType> media_types)
{
   m_fields.set(http::field::accept, to_string(std::vector<MediaType>(media_types)));
   return *this;
}

RequestBuilder& RequestBuilder::accept(std::initializer_list<std::string_view> media_types)
{
   std::vector<MediaType> parsed;
   for (auto media_type : media_types)
      parsed.push_back(MediaType::parse_or_throw(media_type));
   m_fields.set(http::field::accept, to_string(parsed));
   return *this;
}

// -------------------------------------------------------------------------------------------------

std::optional<MediaType> RequestBuilder::content_type() const
{
   auto it = m_fields.find(http::field::content_type);
   if (it == m_fields.end())
      return std::nullopt;
   return MediaType::parse_or_throw(sv(it->value()));
}

std::unique_ptr<ClientRequest> RequestBuilder::build(Transport& transport) const
{
   return transport.create_request(m_method, m_url, m_fields);
}

// =================================================================================================

RequestBuilder request(Method method, std::string_view target) { return {method, target}; }
RequestBuilder get(std::string_view target) { return {Method::get, target}; }
RequestBuilder head(std::string_view target) { return {Method::head, target}; }
RequestBuilder post(std::string_view target) { return {Method::post, target}; }
RequestBuilder put(std::string_view target) { return {Method::put, target}; }
RequestBuilder patch(std::string_view target) { return {Method::patch, target}; }
RequestBuilder del(std::string_view target) { return {Method::delete_, target}; }
RequestBuilder options(std::string_view target) { return {Method::options, target}; }

// =================================================================================================

} // namespace flowhttp

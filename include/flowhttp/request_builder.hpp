#pragma once

#include "common.hpp"
#include "media_type.hpp"

#include <boost/url/url.hpp>

#include <any>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>

namespace flowhttp
{

class ClientRequest;
class Transport;

// =================================================================================================

/**
 * Description of an outbound request: method, target, headers and optional content.
 *
 * The builder is a value type. The engine takes a copy when a request is performed, so later
 * modifications never affect a request in flight.
 *
 * \code
 * auto request = flowhttp::post("http://localhost:8080/greeting")
 *                   .accept(MediaType::application_json())
 *                   .content(std::string("Hello"));
 * \endcode
 */
class RequestBuilder
{
public:
   /// Throws \c error::malformed_target if \p target is not a valid URI reference.
   RequestBuilder(Method method, std::string_view target);
   RequestBuilder(Method method, boost::urls::url url);

   /// Appends a header value, keeping earlier values of the same name.
   RequestBuilder& header(std::string_view name, std::string_view value);
   RequestBuilder& header(std::string_view name, std::initializer_list<std::string_view> values);

   /// Replaces all headers.
   RequestBuilder& headers(Fields fields);

   RequestBuilder& content_type(const MediaType& media_type);

   /// Throws \c error::invalid_media_type if \p media_type cannot be parsed.
   RequestBuilder& content_type(std::string_view media_type);

   RequestBuilder& accept(const MediaType& media_type);
   RequestBuilder& accept(std::initializer_list<MediaType> media_types);
   RequestBuilder& accept(std::initializer_list<std::string_view> media_types);

   /**
    * Attaches a typed value as content. It is encoded by the first encoder that supports its type
    * and the declared content type. String literals are stored as \c std::string.
    */
   template <typename T>
   RequestBuilder& content(T&& value);

public:
   Method method() const noexcept { return m_method; }
   const boost::urls::url& url() const noexcept { return m_url; }
   const Fields& fields() const noexcept { return m_fields; }

   bool has_content() const noexcept { return m_content.has_value(); }
   const std::any& content() const noexcept { return m_content; }
   std::type_index content_type_index() const noexcept { return m_content_type; }

   /// Declared content type, if any. Throws \c error::invalid_media_type if it is malformed.
   std::optional<MediaType> content_type() const;

   /// Creates a pending request on \p transport, without any I/O.
   std::unique_ptr<ClientRequest> build(Transport& transport) const;

private:
   Method m_method;
   boost::urls::url m_url;
   Fields m_fields;
   std::any m_content;
   std::type_index m_content_type = typeid(void);
};

template <typename T>
RequestBuilder& RequestBuilder::content(T&& value)
{
   using U = std::decay_t<T>;
   if constexpr (std::is_convertible_v<U, std::string_view> && !std::is_same_v<U, std::string>)
   {
      m_content = std::string(std::string_view(value));
      m_content_type = typeid(std::string);
   }
   else
   {
      m_content = U(std::forward<T>(value));
      m_content_type = typeid(U);
   }
   return *this;
}

// =================================================================================================

RequestBuilder request(Method method, std::string_view target);
RequestBuilder get(std::string_view target);
RequestBuilder head(std::string_view target);
RequestBuilder post(std::string_view target);
RequestBuilder put(std::string_view target);
RequestBuilder patch(std::string_view target);
RequestBuilder del(std::string_view target);
RequestBuilder options(std::string_view target);

// =================================================================================================

} // namespace flowhttp

#pragma once

#include "error.hpp"
#include "stream.hpp"

#include <boost/beast/http/status.hpp>

#include <vector>

namespace flowhttp
{

// =================================================================================================

/**
 * Response metadata together with the decoded, not yet consumed body.
 *
 * Created as soon as the response head has arrived. The body can be consumed only once, either by
 * pulling from \ref body() directly or through \ref collect() or \ref flatten(). Consuming it
 * never sends the request again.
 */
template <typename T>
class ResponseEnvelope
{
public:
   ResponseEnvelope(unsigned int status_code, Fields headers, Stream<T> body)
      : m_status_code(status_code), m_headers(std::move(headers)), m_body(std::move(body))
   {
   }

   ResponseEnvelope(ResponseEnvelope&&) noexcept = default;
   ResponseEnvelope& operator=(ResponseEnvelope&&) noexcept = default;

   unsigned int status_code() const noexcept { return m_status_code; }
   boost::beast::http::status status() const noexcept
   {
      return boost::beast::http::int_to_status(m_status_code);
   }

   const Fields& headers() const noexcept { return m_headers; }
   Stream<T>& body() noexcept { return m_body; }

   /// Pulls all remaining elements. Returns an empty vector once the body is exhausted.
   awaitable<std::vector<T>> collect() { return m_body.collect(); }

   /**
    * Returns the first element and cancels the rest of the body. Throws \c error::empty_body if
    * there is none.
    */
   awaitable<T> flatten()
   {
      auto value = co_await m_body.next();
      if (!value)
         throw_error(error::empty_body, "response body is empty");

      m_body.reset();
      co_return std::move(*value);
   }

private:
   unsigned int m_status_code;
   Fields m_headers;
   Stream<T> m_body;
};

// =================================================================================================

} // namespace flowhttp

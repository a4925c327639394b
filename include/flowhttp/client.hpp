#pragma once

#include "codec_registry.hpp"
#include "codecs.hpp"
#include "error.hpp"
#include "request_builder.hpp"
#include "response_envelope.hpp"
#include "transport.hpp"

#include <any>
#include <format>
#include <memory>
#include <optional>
#include <typeindex>

namespace flowhttp
{

// =================================================================================================

struct Config
{
   /// Encoders in order of preference. If not set, \ref default_encoders() are used.
   std::optional<Encoders> encoders;

   /// Decoders in order of preference. If not set, \ref default_decoders() are used.
   std::optional<Decoders> decoders;

   /// Types known to the default JSON codecs.
   std::shared_ptr<const JsonTypes> json_types;

   /**
    * Media type assumed for responses without \c Content-Type. If empty, such responses can only
    * fail with \c error::unsupported_content.
    */
   std::optional<MediaType> missing_content_type = MediaType::application_octet_stream();

   /// Maximum chunk size of the default encoders.
   size_t chunk_size = default_chunk_size;

   Config& with_encoders(Encoders list)
   {
      encoders = std::move(list);
      return *this;
   }

   Config& with_decoders(Decoders list)
   {
      decoders = std::move(list);
      return *this;
   }
};

// =================================================================================================

class Execution;

/**
 * Non-blocking HTTP client engine.
 *
 * The client encodes request content and decodes response bodies with the first codec that
 * matches both the C++ type and the media type involved. It does no I/O by itself, that's up to
 * the \ref Transport. Copies of a client share the transport and the codec registry.
 */
class HttpClient
{
public:
   class Impl;
   explicit HttpClient(std::shared_ptr<Transport> transport, Config config = {});
   ~HttpClient();

   /**
    * Prepares the execution of a request. The builder is copied, and nothing is sent until one
    * of the \c as_* operations of the execution is awaited or pulled.
    */
   Execution perform(RequestBuilder builder) const;

   const CodecRegistry& registry() const noexcept;

private:
   std::shared_ptr<Impl> impl;
};

// =================================================================================================

namespace detail
{

/// Response head and decoded body, as produced by the engine.
struct Exchange
{
   unsigned int status_code = 0;
   Fields headers;
   ValueStream values;
};

/// \p hints are passed to the decoder.
awaitable<Exchange> exchange(std::shared_ptr<HttpClient::Impl> impl, RequestBuilder builder,
                             std::type_index type, Hints hints = {});

template <typename T>
T value_cast(std::any&& value)
{
   if (auto* ptr = std::any_cast<T>(&value))
      return std::move(*ptr);

   throw_error(error::decoding_failed, std::format("decoded {}, but expected {}",
                                                   value.type().name(), typeid(T).name()));
}

template <typename T>
Stream<T> typed(ValueStream values)
{
   return std::move(values).map([](std::any value) { return value_cast<T>(std::move(value)); });
}

template <typename T>
awaitable<T> single(std::shared_ptr<HttpClient::Impl> impl, RequestBuilder builder)
{
   auto result = co_await exchange(std::move(impl), std::move(builder), typeid(T));
   auto value = co_await result.values.next();
   if (!value)
      throw_error(error::empty_body, "expected a value, but response body is empty");

   result.values.reset(); // cancel the rest
   co_return value_cast<T>(std::move(*value));
}

template <typename T>
awaitable<ResponseEnvelope<T>> envelope(std::shared_ptr<HttpClient::Impl> impl,
                                        RequestBuilder builder)
{
   auto result = co_await exchange(std::move(impl), std::move(builder), typeid(T));
   co_return ResponseEnvelope<T>(result.status_code, std::move(result.headers),
                                 typed<T>(std::move(result.values)));
}

/**
 * Performs the exchange on the first pull.
 */
template <typename T>
class ExchangeSource : public Source<T>
{
public:
   ExchangeSource(std::shared_ptr<HttpClient::Impl> impl, RequestBuilder builder)
      : m_impl(std::move(impl)), m_builder(std::move(builder))
   {
   }

   awaitable<std::optional<T>> next() override
   {
      if (m_builder)
      {
         auto builder = std::move(*m_builder);
         m_builder.reset();
         auto result = co_await exchange(m_impl, std::move(builder), typeid(T),
                                         Hints{.stream_array_elements = true});
         m_values = typed<T>(std::move(result.values));
      }
      co_return co_await m_values.next();
   }

private:
   std::shared_ptr<HttpClient::Impl> m_impl;
   std::optional<RequestBuilder> m_builder;
   Stream<T> m_values;
};

} // namespace detail

// -------------------------------------------------------------------------------------------------

/**
 * A request ready to be executed, with the choice of how to consume the response.
 *
 * Each \c as_* call describes an execution of its own. Awaiting (or pulling) it sends the request
 * exactly once. Use \ref as_envelope() to access the response head and the body from a single
 * execution.
 */
class Execution
{
public:
   /// The first decoded value. A top-level JSON array is decoded as a whole. Fails with
   /// \c error::empty_body if there is none.
   template <typename T>
   awaitable<T> as_single() const
   {
      return detail::single<T>(m_impl, m_builder);
   }

   /// All decoded values, pulled at the pace of the consumer. A top-level JSON array is
   /// streamed element by element.
   template <typename T>
   Stream<T> as_stream() const
   {
      return Stream<T>(std::make_unique<detail::ExchangeSource<T>>(m_impl, m_builder));
   }

   /// Status code and headers, together with a stream of decoded values.
   template <typename T>
   awaitable<ResponseEnvelope<T>> as_envelope() const
   {
      return detail::envelope<T>(m_impl, m_builder);
   }

   const RequestBuilder& request() const noexcept { return m_builder; }

private:
   friend class HttpClient;
   Execution(std::shared_ptr<HttpClient::Impl> impl, RequestBuilder builder)
      : m_impl(std::move(impl)), m_builder(std::move(builder))
   {
   }

   std::shared_ptr<HttpClient::Impl> m_impl;
   RequestBuilder m_builder;
};

// =================================================================================================

} // namespace flowhttp

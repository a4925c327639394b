#include "flowhttp/client.hpp"
#include "flowhttp/client_impl.hpp"
#include "flowhttp/formatter.hpp" // IWYU pragma: keep

#include <boost/beast/http/field.hpp>

#include <format>

namespace flowhttp
{

namespace http = boost::beast::http;

// =================================================================================================

std::string_view to_string(ExecutionState state)
{
   switch (state)
   {
   case ExecutionState::built:
      return "built";
   case ExecutionState::body_writing:
      return "body_writing";
   case ExecutionState::sent:
      return "sent";
   case ExecutionState::response_received:
      return "response_received";
   case ExecutionState::decoding:
      return "decoding";
   case ExecutionState::complete:
      return "complete";
   case ExecutionState::failed:
      return "failed";
   }
   return "unknown";
}

// =================================================================================================

namespace
{

/**
 * Tracks the state of one execution. Shared by the engine, the sent callbacks and the decoded
 * body, which outlives the engine coroutine.
 */
class Lifecycle
{
public:
   explicit Lifecycle(size_t id) : m_logPrefix(std::format("exec {}", id)) {}

   void transition(ExecutionState next)
   {
      if (m_state == ExecutionState::failed)
         return;

      mlogd("{} -> {}", to_string(m_state), to_string(next));
      m_state = next;
   }

   void fail(const std::exception_ptr& ex)
   {
      if (m_state == ExecutionState::failed)
         return;

      mlogw("{} -> failed: {}", to_string(m_state), what(ex));
      m_state = ExecutionState::failed;
   }

   ExecutionState state() const noexcept { return m_state; }
   const std::string& logPrefix() const noexcept { return m_logPrefix; }

private:
   std::string m_logPrefix;
   ExecutionState m_state = ExecutionState::built;
};

// -------------------------------------------------------------------------------------------------

/**
 * Reports failures of the response body as transport errors.
 */
class TransportGuard : public Source<Bytes>
{
public:
   explicit TransportGuard(ByteStream body) : m_body(std::move(body)) {}

   awaitable<std::optional<Bytes>> next() override
   {
      std::exception_ptr ex;
      try
      {
         co_return co_await m_body.next();
      }
      catch (const std::exception&)
      {
         ex = std::current_exception();
      }
      rethrow_as_transport_error(ex);
   }

private:
   ByteStream m_body;
};

// -------------------------------------------------------------------------------------------------

/**
 * Drives the lifecycle to its final state while the decoded body is consumed.
 */
class TrackingSource : public Source<std::any>
{
public:
   TrackingSource(ValueStream values, std::shared_ptr<Lifecycle> lifecycle)
      : m_values(std::move(values)), m_lifecycle(std::move(lifecycle))
   {
   }

   awaitable<std::optional<std::any>> next() override
   {
      std::optional<std::any> value;
      std::exception_ptr ex;
      try
      {
         value = co_await m_values.next();
      }
      catch (const std::exception&)
      {
         ex = std::current_exception();
      }

      if (ex)
      {
         m_lifecycle->fail(ex);
         std::rethrow_exception(ex);
      }

      if (value)
         ++m_count;
      else
      {
         logd("[{}] decoded {} element(s)", m_lifecycle->logPrefix(), m_count);
         m_lifecycle->transition(ExecutionState::complete);
      }
      co_return value;
   }

   /// Dropping the body after the first element is how single value consumers finish.
   void destroy(std::unique_ptr<Source<std::any>> self) noexcept override
   {
      logd("[{}] rest of body cancelled after {} element(s)", m_lifecycle->logPrefix(), m_count);
      if (m_count > 0)
         m_lifecycle->transition(ExecutionState::complete);
   }

private:
   ValueStream m_values;
   std::shared_ptr<Lifecycle> m_lifecycle;
   size_t m_count = 0;
};

} // namespace

// =================================================================================================

HttpClient::Impl::Impl(std::shared_ptr<Transport> transport, Config config)
   : m_transport(std::move(transport)), m_config(std::move(config)),
     m_registry(std::make_shared<const CodecRegistry>(
        m_config.encoders.value_or(default_encoders(m_config.json_types, m_config.chunk_size)),
        m_config.decoders.value_or(default_decoders(m_config.json_types))))
{
   logi("HttpClient: ctor ({} encoders, {} decoders)", m_registry->encoders().size(),
        m_registry->decoders().size());
}

HttpClient::Impl::~Impl() { logi("HttpClient: dtor"); }

// -------------------------------------------------------------------------------------------------

MediaType HttpClient::Impl::response_media_type(const Fields& headers) const
{
   auto it = headers.find(http::field::content_type);
   if (it == headers.end())
   {
      if (m_config.missing_content_type)
         return *m_config.missing_content_type;
      throw_error(error::unsupported_content, "response has no Content-Type");
   }

   auto media_type = MediaType::parse(sv(it->value()));
   if (!media_type)
      throw_error(error::unsupported_content,
                  std::format("invalid response Content-Type '{}'", it->value()));
   return *media_type;
}

awaitable<detail::Exchange> HttpClient::Impl::exchange(RequestBuilder builder,
                                                       std::type_index type, Hints hints)
{
   auto lifecycle = std::make_shared<Lifecycle>(++m_executions);
   auto logPrefix = [lifecycle]() { return lifecycle->logPrefix(); };

   try
   {
      auto request = builder.build(*m_transport);
      mlogd("{} {}", sv(http::to_string(builder.method())), sv(builder.url().buffer()));

      //
      // Negotiate the encoder. Without declared content type, any encoder for the type will do,
      // and its default media type is declared instead.
      //
      if (builder.has_content())
      {
         const auto declared = builder.content_type();
         auto media_type = declared.value_or(MediaType::all());
         auto encoder = m_registry->resolve_encoder(builder.content_type_index(), media_type);
         if (!encoder)
            throw_error(error::unsupported_content,
                        std::format("no encoder for {} as {}", builder.content_type_index().name(),
                                    media_type));

         if (!declared)
         {
            media_type = encoder->default_media_type();
            request->mutable_headers().set(http::field::content_type, media_type.to_string());
         }

         request->set_body(encoder->encode(ValueStream::just(builder.content()),
                                           builder.content_type_index(), media_type));
         lifecycle->transition(ExecutionState::body_writing);
      }
      else
         request->set_no_body();

      request->on_sent([lifecycle]() { lifecycle->transition(ExecutionState::sent); },
                       [lifecycle](std::exception_ptr ex) { lifecycle->fail(ex); });

      ClientResponse response;
      try
      {
         response = co_await request->execute();
      }
      catch (const std::exception&)
      {
         rethrow_as_transport_error(std::current_exception());
      }

      lifecycle->transition(ExecutionState::response_received);
      mlogd("status {}", response.status_code);

      //
      // Negotiate the decoder.
      //
      const auto media_type = response_media_type(response.headers);
      auto decoder = m_registry->resolve_decoder(type, media_type, hints);
      if (!decoder)
         throw_error(error::unsupported_content,
                     std::format("no decoder for {} from {}", type.name(), media_type));

      lifecycle->transition(ExecutionState::decoding);
      auto body = ByteStream(std::make_unique<TransportGuard>(std::move(response.body)));
      auto values = decoder->decode(std::move(body), type, media_type, hints);

      co_return detail::Exchange{
         .status_code = response.status_code,
         .headers = std::move(response.headers),
         .values = ValueStream(std::make_unique<TrackingSource>(std::move(values), lifecycle))};
   }
   catch (const std::exception&)
   {
      lifecycle->fail(std::current_exception());
      throw;
   }
}

// =================================================================================================

HttpClient::HttpClient(std::shared_ptr<Transport> transport, Config config)
   : impl(std::make_shared<Impl>(std::move(transport), std::move(config)))
{
}

HttpClient::~HttpClient() = default;

Execution HttpClient::perform(RequestBuilder builder) const
{
   return Execution(impl, std::move(builder));
}

const CodecRegistry& HttpClient::registry() const noexcept { return impl->registry(); }

// -------------------------------------------------------------------------------------------------

awaitable<detail::Exchange> detail::exchange(std::shared_ptr<HttpClient::Impl> impl,
                                             RequestBuilder builder, std::type_index type,
                                             Hints hints)
{
   co_return co_await impl->exchange(std::move(builder), type, std::move(hints));
}

// =================================================================================================

} // namespace flowhttp

#include "flowhttp/beast_transport.hpp"
#include "flowhttp/common.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <format>
#include <limits>

namespace flowhttp::beast_impl
{

namespace beast = boost::beast;
namespace http = beast::http;
namespace errc = boost::system::errc;
using tcp = asio::ip::tcp;

constexpr auto token = asio::as_tuple(asio::deferred);

// =================================================================================================

/**
 * One connection per request. Shared between the request, which writes, and the response body
 * reader, which outlives the request.
 */
class Connection
{
public:
   Connection(asio::any_io_executor executor, const transport::Config& config, std::string prefix)
      : stream(std::move(executor)), config(config), m_logPrefix(std::move(prefix))
   {
      parser.body_limit(std::numeric_limits<uint64_t>::max());
   }

   ~Connection() { mlogd("connection closed"); }

   void expires() { stream.expires_after(config.timeout); }

   void close() noexcept
   {
      boost::system::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      stream.close();
   }

   const std::string& logPrefix() const noexcept { return m_logPrefix; }

   beast::tcp_stream stream;
   beast::flat_buffer buffer;
   http::response_parser<http::buffer_body> parser;
   transport::Config config;

private:
   std::string m_logPrefix;
};

// -------------------------------------------------------------------------------------------------

/**
 * Reads the response body, one buffer per pull.
 */
class BodyReader : public Source<Bytes>
{
public:
   explicit BodyReader(std::shared_ptr<Connection> connection)
      : m_connection(std::move(connection))
   {
   }

   awaitable<std::optional<Bytes>> next() override
   {
      auto& parser = m_connection->parser;
      while (!parser.is_done())
      {
         Bytes chunk(m_connection->config.read_buffer_size);
         parser.get().body().data = chunk.data();
         parser.get().body().size = chunk.size();

         m_connection->expires();
         auto [ec, n] = co_await http::async_read_some(m_connection->stream, m_connection->buffer,
                                                       parser, token);
         if (ec == http::error::need_buffer)
            ec = {};

         if (ec)
         {
            mlogw("read body: {}", ec.message());
            throw boost::system::system_error(ec, "reading response body");
         }

         const size_t payload = chunk.size() - parser.get().body().size;
         mlogd("read body: n={} payload={} done={}", n, payload, parser.is_done());
         if (payload)
         {
            chunk.resize(payload);
            co_return chunk;
         }
      }

      mlogd("read body: complete");
      m_connection->close();
      co_return std::nullopt;
   }

   void destroy(std::unique_ptr<Source<Bytes>> self) noexcept override
   {
      if (!m_connection->parser.is_done())
      {
         mlogd("read body: dropped before completion, closing connection");
         m_connection->close();
      }
   }

   const std::string& logPrefix() const noexcept { return m_connection->logPrefix(); }

private:
   std::shared_ptr<Connection> m_connection;
};

// =================================================================================================

class Request : public ClientRequest
{
public:
   Request(asio::any_io_executor executor, const transport::Config& config, Method method,
           boost::urls::url url, const Fields& headers)
      : ClientRequest(method, std::move(url), headers), m_executor(std::move(executor)),
        m_config(config)
   {
   }

   const std::string& logPrefix() const noexcept { return m_logPrefix; }

protected:
   awaitable<ClientResponse> do_execute() override
   {
      auto connection = co_await connect();
      co_await write_request(*connection);
      notify_sent();

      auto& parser = connection->parser;
      parser.skip(method() == Method::head);

      connection->expires();
      auto [ec, n] = co_await http::async_read_header(connection->stream, connection->buffer,
                                                      parser, token);
      if (ec)
      {
         mlogw("read header: {}", ec.message());
         throw boost::system::system_error(ec, "reading response header");
      }

      auto& message = parser.get();
      mlogd("read header: {} {} (len={})", message.result_int(), sv(message.reason()), n);

      co_return ClientResponse{
         .status_code = message.result_int(),
         .headers = Fields(static_cast<const Fields&>(message)),
         .body = ByteStream(std::make_unique<BodyReader>(std::move(connection)))};
   }

private:
   awaitable<std::shared_ptr<Connection>> connect()
   {
      if (!url().scheme().empty() && url().scheme() != "http")
         throw boost::system::system_error(
            errc::make_error_code(errc::protocol_not_supported),
            std::format("unsupported scheme '{}'", sv(url().scheme())));

      std::string host = url().host_address();
      std::string port = url().has_port() ? std::string(sv(url().port())) : "80";
      m_logPrefix = std::format("{}:{}", host, port);

      mlogd("resolving ...");
      tcp::resolver resolver(m_executor);
      auto [ec, endpoints] = co_await resolver.async_resolve(host, port, token);
      if (ec)
      {
         mlogw("resolving: {}", ec.message());
         throw boost::system::system_error(ec, std::format("resolving {}", host));
      }

      auto connection = std::make_shared<Connection>(m_executor, m_config, m_logPrefix);
      connection->expires();
      tcp::endpoint endpoint;
      std::tie(ec, endpoint) = co_await connection->stream.async_connect(endpoints, token);
      if (ec)
      {
         mlogw("connect: {}", ec.message());
         throw boost::system::system_error(ec, std::format("connecting to {}", m_logPrefix));
      }

      mlogd("connected to {}", endpoint.address().to_string());
      co_return connection;
   }

   awaitable<void> write_request(Connection& connection)
   {
      auto target = url().encoded_target();
      http::request<http::buffer_body> message;
      message.version(11);
      message.method(method());
      message.target(target.empty() ? std::string_view("/")
                                    : make_string_view(target.data(), target.size()));

      for (auto&& field : headers())
         message.insert(field.name_string(), field.value());

      if (message.find(http::field::host) == message.end())
      {
         auto host = url().encoded_host_and_port();
         message.set(http::field::host, make_string_view(host.data(), host.size()));
      }
      if (message.find(http::field::user_agent) == message.end())
         message.set(http::field::user_agent, m_config.user_agent);

      //
      // Without body, there is neither 'Content-Length' nor 'Transfer-Encoding'. Otherwise, the
      // size is unknown up front, so the body is always sent chunked.
      //
      const bool with_body = has_body();
      auto body = take_body();
      if (with_body)
         message.chunked(true);

      message.body().data = nullptr;
      message.body().size = 0;
      message.body().more = with_body;

      http::request_serializer<http::buffer_body> serializer{message};

      connection.expires();
      auto [ec, n] = co_await http::async_write_header(connection.stream, serializer, token);
      if (ec)
         throw boost::system::system_error(ec, "writing request header");
      mlogd("write header: {} {} (chunked={})", sv(http::to_string(method())), sv(message.target()),
            with_body);

      size_t total = 0;
      while (auto chunk = co_await body.next())
      {
         if (chunk->empty())
            continue; // an empty buffer would terminate the chunked body

         message.body().data = chunk->data();
         message.body().size = chunk->size();
         message.body().more = true;

         connection.expires();
         std::tie(ec, n) = co_await http::async_write(connection.stream, serializer, token);
         if (ec == http::error::need_buffer)
            ec = {};
         if (ec)
            throw boost::system::system_error(ec, "writing request body");

         total += chunk->size();
      }

      message.body().data = nullptr;
      message.body().size = 0;
      message.body().more = false;

      connection.expires();
      std::tie(ec, n) = co_await http::async_write(connection.stream, serializer, token);
      if (ec)
         throw boost::system::system_error(ec, "writing request");

      mlogd("write body: {} bytes", total);
   }

private:
   asio::any_io_executor m_executor;
   transport::Config m_config;
   std::string m_logPrefix = "beast";
};

} // namespace flowhttp::beast_impl

// =================================================================================================

namespace flowhttp
{

BeastTransport::BeastTransport(asio::any_io_executor executor, transport::Config config)
   : m_executor(std::move(executor)), m_config(std::move(config))
{
   logi("BeastTransport: ctor (read_buffer_size={} timeout={}ms)", m_config.read_buffer_size,
        m_config.timeout.count());
}

std::unique_ptr<ClientRequest> BeastTransport::create_request(Method method, boost::urls::url url,
                                                              const Fields& headers)
{
   return std::make_unique<beast_impl::Request>(m_executor, m_config, method, std::move(url),
                                                headers);
}

// =================================================================================================

} // namespace flowhttp

#include "flowhttp/beast_transport.hpp"
#include "flowhttp/client.hpp"

#include "mock_transport.hpp"
#include "test_types.hpp"

#include <boost/asio/deferred.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <gtest/gtest.h>

#include <format>

using namespace flowhttp;
using namespace flowhttp::test;

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

// =================================================================================================

namespace
{

/// What the server has seen of a request.
struct ServerRecord
{
   http::verb method;
   std::string target;
   bool chunked = false;
   bool content_length = false;
   std::string host;
   std::string user_agent;
   std::string content_type;
   std::string body;
};

} // namespace

// =================================================================================================

/**
 * Runs a minimal HTTP/1.1 server on the loopback interface. Requests with a body are echoed,
 * others are answered with a fixed text.
 */
class BeastTransportTest : public testing::Test
{
protected:
   boost::asio::io_context context;
   tcp::acceptor acceptor{context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)};
   std::vector<ServerRecord> records;
   std::string reply = "Hello Beast!";

   std::string url(std::string_view path)
   {
      return std::format("http://127.0.0.1:{}{}", acceptor.local_endpoint().port(), path);
   }

   HttpClient make_client(transport::Config config = {})
   {
      auto types = std::make_shared<JsonTypes>();
      types->add<Pojo>();
      return HttpClient(std::make_shared<BeastTransport>(context.get_executor(), config),
                        Config{.json_types = types});
   }

   void serve(size_t count)
   {
      boost::asio::co_spawn(context, server(count), boost::asio::detached);
   }

   awaitable<void> server(size_t count)
   {
      for (size_t i = 0; i < count; ++i)
      {
         beast::tcp_stream stream(co_await acceptor.async_accept(boost::asio::deferred));
         beast::flat_buffer buffer;
         http::request<http::string_body> request;
         co_await http::async_read(stream, buffer, request, boost::asio::deferred);

         records.push_back(ServerRecord{
            .method = request.method(),
            .target = std::string(request.target()),
            .chunked = request.chunked(),
            .content_length = request.find(http::field::content_length) != request.end(),
            .host = std::string(request[http::field::host]),
            .user_agent = std::string(request[http::field::user_agent]),
            .content_type = std::string(request[http::field::content_type]),
            .body = request.body()});

         http::response<http::string_body> response{http::status::ok, 11};
         if (request.body().empty())
         {
            response.set(http::field::content_type, "text/plain");
            response.body() = reply;
         }
         else
         {
            response.set(http::field::content_type, request[http::field::content_type]);
            response.body() = request.body();
         }
         response.keep_alive(false);
         response.prepare_payload();
         co_await http::async_write(stream, response, boost::asio::deferred);

         boost::system::error_code ec;
         stream.socket().shutdown(tcp::socket::shutdown_send, ec);
      }
   }
};

// -------------------------------------------------------------------------------------------------

TEST_F(BeastTransportTest, GetWithoutBody)
{
   serve(1);
   auto client = make_client();
   auto envelope =
      run_until_done(context, client.perform(get(url("/greeting?x=1"))).as_envelope<std::string>());
   auto body = run_until_done(context, envelope.collect());

   EXPECT_EQ(envelope.status_code(), 200);
   EXPECT_EQ(body, std::vector<std::string>{"Hello Beast!"});

   ASSERT_EQ(records.size(), 1);
   EXPECT_EQ(records[0].method, http::verb::get);
   EXPECT_EQ(records[0].target, "/greeting?x=1");
   EXPECT_FALSE(records[0].chunked);
   EXPECT_FALSE(records[0].content_length);
   EXPECT_EQ(records[0].host, std::format("127.0.0.1:{}", acceptor.local_endpoint().port()));
   EXPECT_EQ(records[0].user_agent, "flowhttp/0.1");
}

TEST_F(BeastTransportTest, PostIsChunked)
{
   serve(1);
   auto client = make_client();
   auto result = run_until_done(
      context, client.perform(post(url("/echo")).content("Hello Spring!")).as_single<std::string>());

   EXPECT_EQ(result, "Hello Spring!");
   ASSERT_EQ(records.size(), 1);
   EXPECT_EQ(records[0].method, http::verb::post);
   EXPECT_TRUE(records[0].chunked);
   EXPECT_FALSE(records[0].content_length);
   EXPECT_EQ(records[0].content_type, "text/plain;charset=UTF-8");
   EXPECT_EQ(records[0].body, "Hello Spring!");
}

TEST_F(BeastTransportTest, JsonEcho)
{
   serve(1);
   auto client = make_client();
   const Pojo pojo{.foo = "f", .bar = "b"};
   auto result = run_until_done(
      context, client.perform(put(url("/echo")).content(pojo)).as_single<Pojo>());

   EXPECT_EQ(result, pojo);
   ASSERT_EQ(records.size(), 1);
   EXPECT_EQ(records[0].content_type, "application/json");
   EXPECT_EQ(records[0].body, R"({"bar":"b","foo":"f"})");
}

TEST_F(BeastTransportTest, CustomHeaders)
{
   serve(1);
   auto client = make_client();
   run_until_done(context, client.perform(get(url("/")).header("User-Agent", "test/1.0"))
                              .as_single<std::string>());

   ASSERT_EQ(records.size(), 1);
   EXPECT_EQ(records[0].user_agent, "test/1.0");
}

TEST_F(BeastTransportTest, BodyIsStreamed)
{
   reply = std::string(1000, 'x');
   serve(1);

   auto client = make_client(transport::Config{.read_buffer_size = 100});
   auto chunks = run_until_done(
      context, client.perform(get(url("/"))).as_stream<Bytes>().collect());

   std::string body;
   for (const auto& chunk : chunks)
   {
      EXPECT_LE(chunk.size(), 100);
      body.append(make_string_view(chunk));
   }
   EXPECT_GT(chunks.size(), 1);
   EXPECT_EQ(body, reply);
}

TEST_F(BeastTransportTest, ConnectionRefused)
{
   const auto target = url("/");
   acceptor.close();

   auto client = make_client();
   try
   {
      run_until_done(context, client.perform(get(target)).as_single<std::string>());
      FAIL() << "expected exception";
   }
   catch (const TransportError& ex)
   {
      EXPECT_EQ(ex.code(), make_error_code(error::transport));
      EXPECT_TRUE(ex.cause() == boost::system::errc::make_error_condition(
                                 boost::system::errc::connection_refused))
         << ex.cause().message();
   }
}

TEST_F(BeastTransportTest, UnsupportedScheme)
{
   auto client = make_client();
   try
   {
      run_until_done(context, client.perform(get("https://127.0.0.1/")).as_single<std::string>());
      FAIL() << "expected exception";
   }
   catch (const TransportError& ex)
   {
      EXPECT_TRUE(ex.cause() == boost::system::errc::make_error_condition(
                                 boost::system::errc::protocol_not_supported));
   }
}

// =================================================================================================

#pragma once

#include "flowhttp/transport.hpp"
#include "flowhttp/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace flowhttp::test
{

// =================================================================================================

/// What the mock transport has seen of a request.
struct RecordedRequest
{
   Method method;
   boost::urls::url url;
   Fields headers;
   bool has_body = false;
   std::vector<Bytes> chunks;

   std::string body() const;
};

/// What the mock transport responds with.
struct MockResponse
{
   unsigned int status_code = 200;
   Fields headers;
   std::vector<Bytes> chunks;
   std::exception_ptr body_error; ///< raised after all chunks have been pulled

   static MockResponse text(std::string_view content_type, std::string_view body);
};

/**
 * In-memory transport. Records requests and answers them with a configurable handler, echoing
 * the request body (and its content type) by default.
 */
class MockTransport : public Transport, public std::enable_shared_from_this<MockTransport>
{
public:
   using Handler = std::function<MockResponse(const RecordedRequest&)>;

   static MockResponse echo(const RecordedRequest& request);

   std::unique_ptr<ClientRequest> create_request(Method method, boost::urls::url url,
                                                 const Fields& headers) override;

public:
   Handler handler = echo;

   /// If set, executing a request fails with this error before anything is sent.
   boost::system::error_code connect_error;

   std::vector<RecordedRequest> requests;

   size_t created = 0;        ///< number of requests created
   size_t sent = 0;           ///< number of requests that reached the send primitive
   size_t body_pulls = 0;     ///< number of response body chunks pulled
   size_t cancelled = 0;      ///< number of response bodies dropped before completion
   size_t body_completed = 0; ///< number of response bodies read to the end
};

// -------------------------------------------------------------------------------------------------

inline ByteStream byte_stream(std::vector<std::string_view> chunks)
{
   std::vector<Bytes> result;
   for (auto chunk : chunks)
      result.push_back(make_bytes(chunk));
   return ByteStream::from(std::move(result));
}

inline awaitable<std::string> join(ByteStream bytes)
{
   std::string result;
   while (auto chunk = co_await bytes.next())
      result.append(make_string_view(*chunk));
   co_return result;
}

/// Runs \p task to completion on \p context, rethrowing its exception, if any.
template <typename T>
T run_until_done(boost::asio::io_context& context, awaitable<T> task)
{
   auto future = boost::asio::co_spawn(context, std::move(task), boost::asio::use_future);
   ::run(context);
   context.restart();
   return future.get();
}

// =================================================================================================

} // namespace flowhttp::test

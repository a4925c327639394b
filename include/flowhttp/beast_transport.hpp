#pragma once

#include "transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <string>

namespace flowhttp::transport
{

// =================================================================================================

struct Config
{
   /// Sent as \c User-Agent unless the request sets one itself.
   std::string user_agent = "flowhttp/0.1";

   /// Size of the buffer the response body is read into, which bounds the size of body chunks.
   size_t read_buffer_size = 64 * 1024;

   /// Applies to each individual I/O operation.
   std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

} // namespace flowhttp::transport

namespace flowhttp
{

// =================================================================================================

/**
 * HTTP/1.1 transport using Boost.Beast.
 *
 * Every request uses a connection of its own, which is closed when the response body has been
 * consumed or dropped. Request bodies are sent with chunked transfer encoding, requests without
 * body have neither \c Content-Length nor \c Transfer-Encoding.
 */
class BeastTransport : public Transport
{
public:
   explicit BeastTransport(asio::any_io_executor executor, transport::Config config = {});

   std::unique_ptr<ClientRequest> create_request(Method method, boost::urls::url url,
                                                 const Fields& headers) override;

   const asio::any_io_executor& get_executor() const noexcept { return m_executor; }
   const transport::Config& config() const noexcept { return m_config; }

private:
   asio::any_io_executor m_executor;
   transport::Config m_config;
};

// =================================================================================================

} // namespace flowhttp

#pragma once

#include "common.hpp"
#include "stream.hpp"

#include <boost/url/url.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace flowhttp
{

// =================================================================================================

/**
 * Response as delivered by a transport, available as soon as the response head has arrived.
 *
 * The body is read lazily: nothing beyond the head is received until it is pulled.
 */
struct ClientResponse
{
   unsigned int status_code = 0;
   Fields headers;
   ByteStream body;
};

// =================================================================================================

/**
 * Pending request handle, created by a \ref Transport.
 *
 * A request can be executed only once. The guard is an atomic test-and-set, so a second call to
 * \ref execute() fails with \c error::double_send, even when racing the first one. Once sent, the
 * headers are read-only.
 */
class ClientRequest
{
public:
   using SentHandler = std::function<void()>;
   using FailedHandler = std::function<void(std::exception_ptr)>;

   ClientRequest(Method method, boost::urls::url url, Fields headers);
   virtual ~ClientRequest();

   ClientRequest(const ClientRequest&) = delete;
   ClientRequest& operator=(const ClientRequest&) = delete;

   Method method() const noexcept { return m_method; }
   const boost::urls::url& url() const noexcept { return m_url; }

   const Fields& headers() const noexcept { return m_headers; }

   /// Throws \c error::headers_read_only after the request has been sent.
   Fields& mutable_headers();

   /// Sets a streamed body. Throws \c error::body_already_set if a body (or none) was set before.
   void set_body(ByteStream body);

   /// Marks the request as having no body at all.
   void set_no_body();

   bool has_body() const noexcept { return m_body.has_value(); }
   bool is_sent() const noexcept { return m_sent.load(); }

   /**
    * Registers callbacks for the completion of the transmission. Exactly one of them is invoked,
    * once, after the request (including its body) has been written or writing it has failed.
    */
   void on_sent(SentHandler success, FailedHandler failure = {});

   /// Sends the request and waits for the response head.
   awaitable<ClientResponse> execute();

protected:
   virtual awaitable<ClientResponse> do_execute() = 0;

   /// Hands over the body to the implementation, an empty stream if there is none.
   ByteStream take_body();

   /// Invokes the sent callbacks, a null \p error meaning success. Only the first call counts.
   void notify_sent(std::exception_ptr error = nullptr);

private:
   Method m_method;
   boost::urls::url m_url;
   Fields m_headers;
   std::optional<ByteStream> m_body;
   bool m_body_decided = false;
   std::atomic<bool> m_sent{false};
   std::atomic<bool> m_notified{false};
   std::vector<std::pair<SentHandler, FailedHandler>> m_sent_handlers;
};

// =================================================================================================

/**
 * Network side of the engine. Implementations create pending requests, which do the actual I/O
 * once executed.
 */
class Transport
{
public:
   virtual ~Transport() = default;

   /// Creates a request, without doing any I/O. The headers are copied into the request.
   virtual std::unique_ptr<ClientRequest> create_request(Method method, boost::urls::url url,
                                                         const Fields& headers) = 0;
};

// =================================================================================================

} // namespace flowhttp

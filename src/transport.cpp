#include "flowhttp/error.hpp"
#include "flowhttp/transport.hpp"

namespace flowhttp
{

// =================================================================================================

ClientRequest::ClientRequest(Method method, boost::urls::url url, Fields headers)
   : m_method(method), m_url(std::move(url)), m_headers(std::move(headers))
{
}

ClientRequest::~ClientRequest() = default;

// -------------------------------------------------------------------------------------------------

Fields& ClientRequest::mutable_headers()
{
   if (m_sent)
      throw_error(error::headers_read_only, "headers are read-only once the request is sent");
   return m_headers;
}

void ClientRequest::set_body(ByteStream body)
{
   if (m_body_decided)
      throw_error(error::body_already_set, "request body has already been set");
   m_body_decided = true;
   m_body.emplace(std::move(body));
}

void ClientRequest::set_no_body()
{
   if (m_body_decided)
      throw_error(error::body_already_set, "request body has already been set");
   m_body_decided = true;
}

void ClientRequest::on_sent(SentHandler success, FailedHandler failure)
{
   m_sent_handlers.emplace_back(std::move(success), std::move(failure));
}

// -------------------------------------------------------------------------------------------------

awaitable<ClientResponse> ClientRequest::execute()
{
   bool expected = false;
   if (!m_sent.compare_exchange_strong(expected, true))
      throw_error(error::double_send, "request has already been sent");

   std::exception_ptr ex;
   try
   {
      co_return co_await do_execute();
   }
   catch (const std::exception&)
   {
      ex = std::current_exception();
   }

   notify_sent(ex); // no-op if the request was sent and receiving the response failed
   std::rethrow_exception(ex);
}

ByteStream ClientRequest::take_body()
{
   if (!m_body)
      return ByteStream::empty();

   auto body = std::move(*m_body);
   m_body.reset();
   return body;
}

void ClientRequest::notify_sent(std::exception_ptr error)
{
   if (m_notified.exchange(true))
      return;

   for (auto& [success, failure] : m_sent_handlers)
   {
      if (!error && success)
         success();
      else if (error && failure)
         failure(error);
   }
   m_sent_handlers.clear();
}

// =================================================================================================

} // namespace flowhttp

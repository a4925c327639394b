#pragma once

#include "client.hpp"

#include <atomic>

namespace flowhttp
{

// =================================================================================================

/**
 * Lifecycle of a single execution. \c failed is final and can be reached from any other state.
 */
enum class ExecutionState
{
   built,
   body_writing,
   sent,
   response_received,
   decoding,
   complete,
   failed
};

std::string_view to_string(ExecutionState state);

// =================================================================================================

class HttpClient::Impl
{
public:
   Impl(std::shared_ptr<Transport> transport, Config config);
   ~Impl();

   awaitable<detail::Exchange> exchange(RequestBuilder builder, std::type_index type,
                                        Hints hints);

   const CodecRegistry& registry() const noexcept { return *m_registry; }
   Transport& transport() noexcept { return *m_transport; }

private:
   MediaType response_media_type(const Fields& headers) const;

private:
   const std::shared_ptr<Transport> m_transport;
   const Config m_config;
   const std::shared_ptr<const CodecRegistry> m_registry;
   std::atomic<size_t> m_executions{0};
};

// =================================================================================================

} // namespace flowhttp

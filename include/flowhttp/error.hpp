#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <string>
#include <type_traits>

namespace flowhttp
{

// =================================================================================================

/**
 * Errors raised by the flowhttp engine.
 *
 * All of them are delivered as \c boost::system::system_error through the same awaitable that
 * would otherwise deliver the result, so every execution terminates with exactly one signal.
 */
enum class error
{
   malformed_target = 1, ///< target locator could not be parsed
   unsupported_content,  ///< no encoder or decoder matches type and media type
   double_send,          ///< one-shot send guard was tripped twice
   empty_body,           ///< single-value consumption of an empty body
   transport,            ///< lower layer failure, see TransportError::cause()
   invalid_media_type,   ///< media type string could not be parsed
   body_already_set,     ///< ClientRequest::set_body() called twice
   headers_read_only,    ///< header mutation after the request has been sent
   decoding_failed       ///< decoder could not make sense of the payload
};

const boost::system::error_category& category() noexcept;

boost::system::error_code make_error_code(error e) noexcept;

[[noreturn]] void throw_error(error e, const std::string& what);

/// True if \p ec was raised by flowhttp itself (as opposed to the transport or the OS).
bool is_flowhttp_error(const boost::system::error_code& ec) noexcept;

// -------------------------------------------------------------------------------------------------

/**
 * Wraps a failure of the transport layer.
 *
 * \c code() is always \c error::transport, while \c cause() carries the original error code and
 * \c nested() the original exception, if there was one.
 */
class TransportError : public boost::system::system_error
{
public:
   TransportError(boost::system::error_code cause, const std::string& what);
   explicit TransportError(std::exception_ptr nested);

   const boost::system::error_code& cause() const noexcept { return m_cause; }
   const std::exception_ptr& nested() const noexcept { return m_nested; }

private:
   boost::system::error_code m_cause;
   std::exception_ptr m_nested;
};

/**
 * Rethrows \p ptr, converting anything that is not a flowhttp error into a \ref TransportError.
 */
[[noreturn]] void rethrow_as_transport_error(std::exception_ptr ptr);

// =================================================================================================

} // namespace flowhttp

template <>
struct boost::system::is_error_code_enum<flowhttp::error> : std::true_type
{
};

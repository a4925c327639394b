#pragma once

#include "logging.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/type_traits.hpp>
#include <boost/beast/http/verb.hpp>

#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace flowhttp
{
namespace asio = boost::asio;
using asio::awaitable;

// =================================================================================================

using Method = boost::beast::http::verb;

using Fields = boost::beast::http::fields;
static_assert(boost::beast::http::is_fields<Fields>::value);

/// Raw payload bytes, as produced by encoders and consumed by decoders.
using Bytes = std::vector<std::uint8_t>;

using error_code = boost::system::error_code;
template <typename T>
using expected = std::expected<T, boost::system::error_code>;

// =================================================================================================

inline std::string_view sv(boost::core::string_view str) noexcept
{
   return {str.data(), str.size()};
}

template <class T>
constexpr std::string_view make_string_view(const T* data, size_t len)
{
   return {static_cast<const char*>(static_cast<const void*>(data)), len};
}

inline std::string_view make_string_view(const Bytes& bytes)
{
   return make_string_view(bytes.data(), bytes.size());
}

inline Bytes make_bytes(std::string_view str) { return Bytes(str.begin(), str.end()); }

// =================================================================================================

} // namespace flowhttp

// -------------------------------------------------------------------------------------------------

/// Get error message from exception pointer, as used in the completion signature of \c co_spawn().
std::string what(const std::exception_ptr& ptr);

/// Get error message from \c boost::system::error_code, used by ASIO.
std::string what(const boost::system::error_code& ec);

// =================================================================================================

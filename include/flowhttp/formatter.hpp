#pragma once

#include "media_type.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/detail/string_view.hpp>

#include <format>
#include <string_view>

// =================================================================================================

template <>
struct std::formatter<boost::core::string_view> : public std::formatter<std::string_view>
{
   template <typename FormatContext>
   constexpr auto format(boost::core::string_view sv, FormatContext& ctx) const
   {
      return std::formatter<std::string_view>::format(std::string_view{sv.data(), sv.size()}, ctx);
   }
};

// -------------------------------------------------------------------------------------------------

template <>
struct std::formatter<boost::beast::http::field> : public std::formatter<std::string_view>
{
   template <typename FormatContext>
   auto format(boost::beast::http::field field, FormatContext& ctx) const
   {
      auto name = to_string(field);
      return std::formatter<std::string_view>::format(std::string_view{name.data(), name.size()},
                                                      ctx);
   }
};

template <>
struct std::formatter<boost::beast::http::verb> : public std::formatter<std::string_view>
{
   template <typename FormatContext>
   auto format(boost::beast::http::verb verb, FormatContext& ctx) const
   {
      auto name = to_string(verb);
      return std::formatter<std::string_view>::format(std::string_view{name.data(), name.size()},
                                                      ctx);
   }
};

// -------------------------------------------------------------------------------------------------

template <>
struct std::formatter<flowhttp::MediaType> : public std::formatter<std::string_view>
{
   template <typename FormatContext>
   auto format(const flowhttp::MediaType& media_type, FormatContext& ctx) const
   {
      return std::formatter<std::string_view>::format(media_type.to_string(), ctx);
   }
};

// =================================================================================================

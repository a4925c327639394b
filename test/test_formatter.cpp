#include <gtest/gtest.h>
#include "flowhttp/formatter.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/detail/string_view.hpp>

#include <format>

// =================================================================================================
// Test boost::core::string_view formatter
// =================================================================================================

TEST(FormatterTest, BoostStringView)
{
   boost::core::string_view sv("test string");
   EXPECT_EQ(std::format("{}", sv), "test string");
   EXPECT_EQ(std::format("[{:<6}]", boost::core::string_view("ab")), "[ab    ]");
}

// =================================================================================================
// Test boost::beast::http::field and verb formatters
// =================================================================================================

TEST(FormatterTest, Field)
{
   EXPECT_EQ(std::format("{}", boost::beast::http::field::content_type), "Content-Type");
   EXPECT_EQ(std::format("{}", boost::beast::http::field::transfer_encoding), "Transfer-Encoding");
}

TEST(FormatterTest, Verb)
{
   EXPECT_EQ(std::format("{}", boost::beast::http::verb::get), "GET");
   EXPECT_EQ(std::format("{:>7}", boost::beast::http::verb::delete_), " DELETE");
}

// =================================================================================================
// Test flowhttp::MediaType formatter
// =================================================================================================

TEST(FormatterTest, MediaType)
{
   auto media_type = flowhttp::MediaType::text_plain().with_parameter("charset", "UTF-8");
   EXPECT_EQ(std::format("{}", media_type), "text/plain;charset=UTF-8");
}

// =================================================================================================

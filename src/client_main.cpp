#include "flowhttp/beast_transport.hpp"
#include "flowhttp/client.hpp"
#include "flowhttp/formatter.hpp"
#include "flowhttp/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <json/value.h>

#include <print>

using namespace flowhttp;
using namespace boost::asio;

//
// Fetches a resource and prints the body as it arrives. With '--json', the body is printed one
// top-level JSON value (or array element) per line.
//
awaitable<void> fetch(HttpClient client, std::string url, bool json)
{
   if (json)
   {
      auto values =
         client.perform(get(url).accept(MediaType::application_json())).as_stream<Json::Value>();
      while (auto value = co_await values.next())
         std::println("{}", to_canonical_json(*value));
      co_return;
   }

   auto response = co_await client.perform(get(url)).as_envelope<Bytes>();
   std::println(stderr, "{} {}", response.status_code(),
                response.headers()[boost::beast::http::field::content_type]);

   size_t total = 0;
   while (auto chunk = co_await response.body().next())
   {
      std::print("{}", make_string_view(*chunk));
      total += chunk->size();
   }
   logi("fetch: {} bytes", total);
}

int main(int argc, char* argv[])
{
   if (argc < 2)
   {
      std::println("Usage: {} [--json] URL", argv[0]);
      return 1;
   }

   const bool json = argc > 2 && std::string_view(argv[1]) == "--json";

#if !defined(NDEBUG)
   spdlog::set_level(spdlog::level::debug);
#endif

   io_context context;
   auto transport = std::make_shared<BeastTransport>(context.get_executor());
   HttpClient client(transport);

   int rc = 0;
   co_spawn(context, fetch(client, argv[argc - 1], json),
            [&rc](const std::exception_ptr& ex)
            {
               if (ex)
               {
                  std::println(stderr, "error: {}", what(ex));
                  rc = 1;
               }
            });

   ::run(context);
   return rc;
}

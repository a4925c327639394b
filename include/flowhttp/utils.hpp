#pragma once

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <print>

#define LOG(FMT, ...) std::println(FMT __VA_OPT__(, ) __VA_ARGS__)

/**
 * Runs \p context until it is out of work. Debug builds trace each handler invocation, and
 * highlight the slow ones.
 */
size_t run(boost::asio::io_context& context);

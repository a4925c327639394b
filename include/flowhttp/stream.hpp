#pragma once

#include "common.hpp"

#include <boost/asio/awaitable.hpp>

#include <deque>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace flowhttp
{

// =================================================================================================

/**
 * Producer side of a \ref Stream.
 *
 * \c next() is only called when the consumer asks for the next element, and never concurrently.
 * Returning \c std::nullopt signals the end of the sequence, throwing signals failure. Either one
 * is final.
 */
template <typename T>
class Source
{
public:
   virtual ~Source() = default;

   virtual awaitable<std::optional<T>> next() = 0;

   /**
    * Called when the owning stream is dropped before the sequence is complete. Implementations
    * use this to pass cancellation upstream, for example by shutting down a connection. They may
    * also keep \p self alive for a while if there is still an operation in flight.
    */
   virtual void destroy(std::unique_ptr<Source> self) noexcept { /* delete self */ }
};

// =================================================================================================

/**
 * Lazy, single-pass, pull-based sequence of values.
 *
 * Nothing happens until a consumer calls \ref next(). Each call pulls at most one element through
 * the chain of sources, which gives natural backpressure from the consumer all the way to the
 * transport. After the end of the sequence (or a failure), the stream is empty and further calls
 * to \ref next() return \c std::nullopt. Dropping a stream before that point cancels it.
 */
template <typename T>
class Stream
{
public:
   using value_type = T;
   using source_type = Source<T>;

   Stream() = default;
   explicit Stream(std::unique_ptr<source_type> source) : m_source(std::move(source)) {}
   Stream(Stream&& other) noexcept = default;
   Stream& operator=(Stream&& other) noexcept
   {
      if (this != &other)
      {
         reset();
         m_source = std::move(other.m_source);
      }
      return *this;
   }
   ~Stream() { reset(); }

   /// Cancels the stream if it was not exhausted yet.
   void reset() noexcept
   {
      if (m_source)
      {
         auto temp = m_source.get();
         temp->destroy(std::move(m_source)); // give implementation a chance for cancellation
      }
   }

   /// True until the sequence has completed, failed or was cancelled.
   bool active() const noexcept { return static_cast<bool>(m_source); }

   awaitable<std::optional<T>> next()
   {
      if (!m_source)
         co_return std::nullopt;

      std::optional<T> value;
      try
      {
         value = co_await m_source->next();
      }
      catch (...)
      {
         m_source.reset();
         throw;
      }

      if (!value)
         m_source.reset(); // completed, nothing to cancel

      co_return value;
   }

   /// Pulls all remaining elements.
   awaitable<std::vector<T>> collect()
   {
      std::vector<T> result;
      while (auto value = co_await next())
         result.push_back(std::move(*value));
      co_return result;
   }

public:
   template <typename F>
   auto map(F function) &&;

   template <typename F>
   auto flat_map(F function) &&;

   static Stream just(T value);
   static Stream from(std::vector<T> values);
   static Stream empty() { return Stream{}; }
   static Stream failed(std::exception_ptr error);

private:
   std::unique_ptr<source_type> m_source;
};

// =================================================================================================

namespace detail
{

template <typename T>
class BufferSource : public Source<T>
{
public:
   explicit BufferSource(std::vector<T> values)
      : m_values(std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()))
   {
   }

   awaitable<std::optional<T>> next() override
   {
      if (m_values.empty())
         co_return std::nullopt;

      auto value = std::move(m_values.front());
      m_values.pop_front();
      co_return value;
   }

private:
   std::deque<T> m_values;
};

template <typename T>
class FailedSource : public Source<T>
{
public:
   explicit FailedSource(std::exception_ptr error) : m_error(std::move(error)) {}

   awaitable<std::optional<T>> next() override
   {
      std::rethrow_exception(m_error);
      co_return std::nullopt;
   }

private:
   std::exception_ptr m_error;
};

template <typename T, typename U, typename F>
class MapSource : public Source<U>
{
public:
   MapSource(Stream<T> upstream, F function)
      : m_upstream(std::move(upstream)), m_function(std::move(function))
   {
   }

   awaitable<std::optional<U>> next() override
   {
      auto value = co_await m_upstream.next();
      if (!value)
         co_return std::nullopt;
      co_return std::invoke(m_function, std::move(*value));
   }

private:
   Stream<T> m_upstream;
   F m_function;
};

/**
 * Maps each upstream element to zero or more elements. The expansion of one element is buffered,
 * the upstream is only pulled when that buffer is empty.
 */
template <typename T, typename U, typename F>
class FlatMapSource : public Source<U>
{
public:
   FlatMapSource(Stream<T> upstream, F function)
      : m_upstream(std::move(upstream)), m_function(std::move(function))
   {
   }

   awaitable<std::optional<U>> next() override
   {
      while (m_pending.empty())
      {
         auto value = co_await m_upstream.next();
         if (!value)
            co_return std::nullopt;

         for (auto&& element : std::invoke(m_function, std::move(*value)))
            m_pending.push_back(std::move(element));
      }

      auto result = std::move(m_pending.front());
      m_pending.pop_front();
      co_return result;
   }

private:
   Stream<T> m_upstream;
   F m_function;
   std::deque<U> m_pending;
};

} // namespace detail

// -------------------------------------------------------------------------------------------------

template <typename T>
template <typename F>
auto Stream<T>::map(F function) &&
{
   using U = std::decay_t<std::invoke_result_t<F&, T&&>>;
   return Stream<U>(
      std::make_unique<detail::MapSource<T, U, F>>(std::move(*this), std::move(function)));
}

template <typename T>
template <typename F>
auto Stream<T>::flat_map(F function) &&
{
   using R = std::decay_t<std::invoke_result_t<F&, T&&>>;
   using U = typename R::value_type;
   return Stream<U>(
      std::make_unique<detail::FlatMapSource<T, U, F>>(std::move(*this), std::move(function)));
}

template <typename T>
Stream<T> Stream<T>::just(T value)
{
   std::vector<T> values;
   values.push_back(std::move(value));
   return from(std::move(values));
}

template <typename T>
Stream<T> Stream<T>::from(std::vector<T> values)
{
   return Stream(std::make_unique<detail::BufferSource<T>>(std::move(values)));
}

template <typename T>
Stream<T> Stream<T>::failed(std::exception_ptr error)
{
   return Stream(std::make_unique<detail::FailedSource<T>>(std::move(error)));
}

// =================================================================================================

using ByteStream = Stream<Bytes>;

// =================================================================================================

} // namespace flowhttp

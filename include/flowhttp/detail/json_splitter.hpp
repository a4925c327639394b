#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace flowhttp::detail
{

// =================================================================================================

/**
 * Incremental splitter for a stream of concatenated JSON texts.
 *
 * Bytes can be fed in arbitrarily sized pieces, values may span several pieces. Every complete
 * top-level value is returned as a separate string. With \p stream_arrays, the elements of a
 * top-level array are returned one by one instead of the array itself, so a large array can be
 * processed as it arrives.
 *
 * Apart from the separators of a streamed array, this is purely lexical. Values are not validated
 * beyond bracket and string structure, which is left to the JSON parser.
 */
class JsonSplitter
{
public:
   explicit JsonSplitter(bool stream_arrays = false) : m_stream_arrays(stream_arrays) {}

   /// Throws \c error::decoding_failed on structural errors.
   void feed(std::string_view data, std::vector<std::string>& values);

   /// Signals end of input. Throws \c error::decoding_failed if a value is incomplete.
   void finish(std::vector<std::string>& values);

private:
   enum class State
   {
      between,
      container,
      string,
      primitive
   };

   /// What may follow inside a streamed top-level array.
   enum class ArrayState
   {
      first_value,
      value,
      separator
   };

   void process(char c, std::vector<std::string>& values);
   void emit(std::vector<std::string>& values);
   [[noreturn]] void unexpected(char c) const;

   const bool m_stream_arrays;
   State m_state = State::between;
   std::string m_current;
   size_t m_depth = 0;
   bool m_in_string = false;
   bool m_escaped = false;
   bool m_in_array = false;
   ArrayState m_array_state = ArrayState::first_value;
   size_t m_offset = 0;
};

// =================================================================================================

} // namespace flowhttp::detail

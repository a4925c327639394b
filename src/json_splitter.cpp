#include "flowhttp/detail/json_splitter.hpp"
#include "flowhttp/error.hpp"

#include <format>

namespace flowhttp::detail
{

// =================================================================================================

namespace
{
inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
} // namespace

void JsonSplitter::feed(std::string_view data, std::vector<std::string>& values)
{
   for (char c : data)
   {
      process(c, values);
      ++m_offset;
   }
}

void JsonSplitter::finish(std::vector<std::string>& values)
{
   if (m_state == State::primitive)
      emit(values);

   if (m_state != State::between || m_in_array)
      throw_error(error::decoding_failed,
                  std::format("truncated JSON input after {} bytes", m_offset));
}

// -------------------------------------------------------------------------------------------------

void JsonSplitter::process(char c, std::vector<std::string>& values)
{
   switch (m_state)
   {
   case State::between:
      if (is_space(c))
         return;

      if (m_in_array)
      {
         if (c == ',')
         {
            if (m_array_state != ArrayState::separator)
               unexpected(c);
            m_array_state = ArrayState::value;
            return;
         }
         if (c == ']')
         {
            if (m_array_state == ArrayState::value)
               unexpected(c);
            m_in_array = false;
            return;
         }
         if (m_array_state == ArrayState::separator)
            unexpected(c);
      }
      else if (c == '[' && m_stream_arrays)
      {
         m_in_array = true;
         m_array_state = ArrayState::first_value;
         return;
      }

      if (c == '{' || c == '[')
      {
         m_state = State::container;
         m_depth = 1;
         m_in_string = false;
         m_escaped = false;
         m_current.assign(1, c);
      }
      else if (c == '"')
      {
         m_state = State::string;
         m_escaped = false;
         m_current.assign(1, c);
      }
      else if (c == ']' || c == '}' || c == ',' || c == ':')
         unexpected(c);
      else
      {
         m_state = State::primitive;
         m_current.assign(1, c);
      }
      return;

   case State::container:
      m_current.push_back(c);
      if (m_in_string)
      {
         if (m_escaped)
            m_escaped = false;
         else if (c == '\\')
            m_escaped = true;
         else if (c == '"')
            m_in_string = false;
      }
      else if (c == '"')
         m_in_string = true;
      else if (c == '{' || c == '[')
         ++m_depth;
      else if ((c == '}' || c == ']') && --m_depth == 0)
         emit(values);
      return;

   case State::string:
      m_current.push_back(c);
      if (m_escaped)
         m_escaped = false;
      else if (c == '\\')
         m_escaped = true;
      else if (c == '"')
         emit(values);
      return;

   case State::primitive:
      if (is_space(c) || c == ',' || c == ']' || c == '}' || c == '[' || c == '{' || c == '"')
      {
         emit(values);
         process(c, values);
      }
      else
         m_current.push_back(c);
      return;
   }
}

void JsonSplitter::emit(std::vector<std::string>& values)
{
   values.push_back(std::move(m_current));
   m_current.clear();
   m_state = State::between;
   if (m_in_array)
      m_array_state = ArrayState::separator;
}

void JsonSplitter::unexpected(char c) const
{
   throw_error(error::decoding_failed, std::format("unexpected '{}' at offset {}", c, m_offset));
}

// =================================================================================================

} // namespace flowhttp::detail

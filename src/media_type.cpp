#include "flowhttp/error.hpp"
#include "flowhttp/media_type.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace flowhttp
{

// =================================================================================================

namespace
{
constexpr std::string_view whitespace = " \t";

std::string_view trim(std::string_view str)
{
   const auto begin = str.find_first_not_of(whitespace);
   if (begin == std::string_view::npos)
      return {};
   const auto end = str.find_last_not_of(whitespace);
   return str.substr(begin, end - begin + 1);
}

std::string lower(std::string_view str)
{
   std::string result(str);
   std::ranges::transform(result, result.begin(),
                          [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
   return result;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
   return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b)
   { return std::tolower(a) == std::tolower(b); });
}

// RFC 7230, section 3.2.6
bool is_token(std::string_view str)
{
   constexpr std::string_view specials = "!#$%&'*+-.^_`|~";
   return !str.empty() && std::ranges::all_of(str, [&](unsigned char c)
   { return std::isalnum(c) || specials.find(static_cast<char>(c)) != std::string_view::npos; });
}

/// Splits at \p separator, but not inside quoted strings.
std::vector<std::string_view> split_unquoted(std::string_view str, char separator)
{
   std::vector<std::string_view> result;
   bool quoted = false;
   bool escaped = false;
   size_t start = 0;
   for (size_t i = 0; i < str.size(); ++i)
   {
      const char c = str[i];
      if (escaped)
         escaped = false;
      else if (quoted && c == '\\')
         escaped = true;
      else if (c == '"')
         quoted = !quoted;
      else if (!quoted && c == separator)
      {
         result.push_back(str.substr(start, i - start));
         start = i + 1;
      }
   }
   result.push_back(str.substr(start));
   return result;
}

std::optional<std::string> unquote(std::string_view value)
{
   if (value.size() < 2 || value.front() != '"')
      return is_token(value) ? std::optional<std::string>(value) : std::nullopt;

   if (value.back() != '"')
      return std::nullopt;

   std::string result;
   value = value.substr(1, value.size() - 2);
   for (size_t i = 0; i < value.size(); ++i)
   {
      if (value[i] == '\\' && i + 1 < value.size())
         ++i;
      result.push_back(value[i]);
   }
   return result;
}

boost::system::error_code invalid() { return make_error_code(error::invalid_media_type); }

} // namespace

// =================================================================================================

MediaType::MediaType(std::string_view type, std::string_view subtype, Parameters parameters)
   : m_type(lower(type)), m_subtype(lower(subtype))
{
   for (auto& [name, value] : parameters)
      m_parameters.emplace_back(lower(name), std::move(value));
}

// -------------------------------------------------------------------------------------------------

expected<MediaType> MediaType::parse(std::string_view str)
{
   auto parts = split_unquoted(str, ';');
   auto full_type = trim(parts.front());
   if (full_type.empty())
      return std::unexpected(invalid());

   MediaType result;
   if (full_type == "*")
      full_type = "*/*";

   const auto slash = full_type.find('/');
   if (slash == std::string_view::npos)
      return std::unexpected(invalid());

   const auto type = full_type.substr(0, slash);
   const auto subtype = full_type.substr(slash + 1);
   if (!is_token(type) || !is_token(subtype))
      return std::unexpected(invalid());

   result.m_type = lower(type);
   result.m_subtype = lower(subtype);
   if (result.is_wildcard_type() && !result.is_wildcard_subtype())
      return std::unexpected(invalid());

   for (auto param : parts | std::views::drop(1))
   {
      param = trim(param);
      if (param.empty())
         continue;

      const auto eq = param.find('=');
      if (eq == std::string_view::npos)
         return std::unexpected(invalid());

      const auto name = trim(param.substr(0, eq));
      auto value = unquote(trim(param.substr(eq + 1)));
      if (!is_token(name) || !value)
         return std::unexpected(invalid());

      result.m_parameters.emplace_back(lower(name), std::move(*value));
   }

   return result;
}

MediaType MediaType::parse_or_throw(std::string_view str)
{
   auto result = parse(str);
   if (!result)
      throw_error(error::invalid_media_type, std::format("'{}'", str));
   return std::move(*result);
}

expected<std::vector<MediaType>> MediaType::parse_list(std::string_view str)
{
   std::vector<MediaType> result;
   for (auto element : split_unquoted(str, ','))
   {
      element = trim(element);
      if (element.empty())
         continue;

      auto media_type = parse(element);
      if (!media_type)
         return std::unexpected(media_type.error());
      result.push_back(std::move(*media_type));
   }
   return result;
}

// -------------------------------------------------------------------------------------------------

std::optional<std::string> MediaType::parameter(std::string_view name) const
{
   for (const auto& [key, value] : m_parameters)
      if (iequals(key, name))
         return value;
   return std::nullopt;
}

MediaType MediaType::with_parameter(std::string_view name, std::string_view value) const
{
   MediaType result = *this;
   auto key = lower(name);
   auto it = std::ranges::find(result.m_parameters, key, &Parameters::value_type::first);
   if (it != result.m_parameters.end())
      it->second = value;
   else
      result.m_parameters.emplace_back(std::move(key), value);
   return result;
}

bool MediaType::is_wildcard_subtype() const noexcept
{
   return m_subtype == "*" || m_subtype.starts_with("*+");
}

std::string_view MediaType::suffix() const noexcept
{
   const auto plus = m_subtype.rfind('+');
   if (plus == std::string::npos)
      return {};
   return std::string_view(m_subtype).substr(plus + 1);
}

bool MediaType::includes(const MediaType& other) const noexcept
{
   if (is_wildcard_type())
      return true;

   if (m_type != other.m_type)
      return false;

   if (m_subtype == other.m_subtype || m_subtype == "*")
      return true;

   // "application/*+json" includes "application/problem+json" and "application/json"
   if (m_subtype.starts_with("*+"))
   {
      const auto own_suffix = suffix();
      return other.suffix() == own_suffix || other.m_subtype == own_suffix;
   }

   return false;
}

bool MediaType::is_compatible_with(const MediaType& other) const noexcept
{
   return includes(other) || other.includes(*this);
}

bool MediaType::equals_type_and_subtype(const MediaType& other) const noexcept
{
   return m_type == other.m_type && m_subtype == other.m_subtype;
}

std::string MediaType::to_string() const
{
   std::string result = std::format("{}/{}", m_type, m_subtype);
   for (const auto& [name, value] : m_parameters)
   {
      if (is_token(value))
         result += std::format(";{}={}", name, value);
      else
         result += std::format(";{}=\"{}\"", name, value);
   }
   return result;
}

std::string to_string(const std::vector<MediaType>& media_types)
{
   std::string result;
   for (const auto& media_type : media_types)
   {
      if (!result.empty())
         result += ", ";
      result += media_type.to_string();
   }
   return result;
}

// =================================================================================================

} // namespace flowhttp

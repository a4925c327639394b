#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowhttp
{

// =================================================================================================

/**
 * A MIME media type as used in \c Content-Type and \c Accept headers, e.g.
 * \c "text/plain;charset=UTF-8".
 *
 * Type, subtype and parameter names are stored lower-case, parameter values as given (with
 * surrounding quotes removed). A default constructed media type is the wildcard \c "*\/*".
 */
class MediaType
{
public:
   using Parameters = std::vector<std::pair<std::string, std::string>>;

   MediaType() = default;
   MediaType(std::string_view type, std::string_view subtype, Parameters parameters = {});

   static expected<MediaType> parse(std::string_view str);

   /// Like \ref parse(), but throws \c error::invalid_media_type.
   static MediaType parse_or_throw(std::string_view str);

   /// Parses a comma separated list, as found in an \c Accept header.
   static expected<std::vector<MediaType>> parse_list(std::string_view str);

   static MediaType all() { return {}; }
   static MediaType text_plain() { return {"text", "plain"}; }
   static MediaType application_json() { return {"application", "json"}; }
   static MediaType application_octet_stream() { return {"application", "octet-stream"}; }
   static MediaType application_xml() { return {"application", "xml"}; }

public:
   const std::string& type() const noexcept { return m_type; }
   const std::string& subtype() const noexcept { return m_subtype; }
   const Parameters& parameters() const noexcept { return m_parameters; }

   std::optional<std::string> parameter(std::string_view name) const;
   std::optional<std::string> charset() const { return parameter("charset"); }

   /// Returns a copy with the given parameter set (or replaced).
   MediaType with_parameter(std::string_view name, std::string_view value) const;

   bool is_wildcard_type() const noexcept { return m_type == "*"; }
   bool is_wildcard_subtype() const noexcept;

   /// The structured syntax suffix, e.g. "json" for "application/problem+json".
   std::string_view suffix() const noexcept;

   /**
    * Returns true if this media type includes \p other, e.g. "text/\*" includes "text/plain",
    * and "application/\*+json" includes "application/problem+json". Parameters are ignored.
    */
   bool includes(const MediaType& other) const noexcept;

   /// Symmetric variant of \ref includes().
   bool is_compatible_with(const MediaType& other) const noexcept;

   /// Type and subtype are equal, ignoring parameters.
   bool equals_type_and_subtype(const MediaType& other) const noexcept;

   std::string to_string() const;

   friend bool operator==(const MediaType& lhs, const MediaType& rhs) = default;

private:
   std::string m_type = "*";
   std::string m_subtype = "*";
   Parameters m_parameters;
};

std::string to_string(const std::vector<MediaType>& media_types);

// =================================================================================================

} // namespace flowhttp

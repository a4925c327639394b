#pragma once

#include "codec.hpp"

#include <json/value.h>

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <typeindex>

namespace flowhttp
{

// =================================================================================================

/**
 * The set of C++ types the JSON codec can map to and from \c Json::Value.
 *
 * \c Json::Value itself is always supported. Other types are added with \ref add(), which requires
 * two functions found by argument dependent lookup:
 *
 * \code
 * Json::Value to_json(const T& value);
 * void from_json(const Json::Value& json, T& value);
 * \endcode
 *
 * Register all types before handing the set to a client. It is shared read-only afterwards.
 */
class JsonTypes
{
public:
   template <typename T>
   JsonTypes& add();

   bool contains(std::type_index type) const;

   Json::Value write(const std::any& value, std::type_index type) const;
   std::any read(const Json::Value& json, std::type_index type) const;

private:
   struct Mapping
   {
      std::function<Json::Value(const std::any&)> write;
      std::function<std::any(const Json::Value&)> read;
   };

   std::map<std::type_index, Mapping> m_mappings;
};

template <typename T>
JsonTypes& JsonTypes::add()
{
   Mapping mapping{
      .write = [](const std::any& value) -> Json::Value
      { return to_json(std::any_cast<const T&>(value)); },
      .read = [](const Json::Value& json) -> std::any
      {
         T value{};
         from_json(json, value);
         return value;
      }};
   m_mappings.insert_or_assign(std::type_index(typeid(T)), std::move(mapping));
   return *this;
}

// =================================================================================================

/**
 * Encodes values as compact JSON, with object members in sorted order. Supports
 * \c application/json and \c application/\*+json.
 */
class JsonEncoder final : public Encoder
{
public:
   explicit JsonEncoder(std::shared_ptr<const JsonTypes> types = {});

   std::string_view name() const noexcept override { return "json"; }
   bool can_encode(std::type_index type, const MediaType& media_type) const override;
   ByteStream encode(ValueStream values, std::type_index type,
                     const MediaType& media_type) const override;
   MediaType default_media_type() const override { return MediaType::application_json(); }

private:
   std::shared_ptr<const JsonTypes> m_types;
};

/**
 * Decodes a stream of JSON texts. Each top-level value is one element, a top-level array yields
 * its elements one by one.
 */
class JsonDecoder final : public Decoder
{
public:
   explicit JsonDecoder(std::shared_ptr<const JsonTypes> types = {});

   std::string_view name() const noexcept override { return "json"; }
   bool can_decode(std::type_index type, const MediaType& media_type,
                   const Hints& hints) const override;
   ValueStream decode(ByteStream bytes, std::type_index type, const MediaType& media_type,
                      const Hints& hints) const override;

private:
   std::shared_ptr<const JsonTypes> m_types;
};

/// Canonical serialization used by \ref JsonEncoder.
std::string to_canonical_json(const Json::Value& json);

// =================================================================================================

} // namespace flowhttp

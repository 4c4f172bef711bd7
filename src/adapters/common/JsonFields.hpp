#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace adapters::json_fields {

// Lenient field readers for provider payloads. Providers mix quoted and bare numbers;
// these accept both and return nullopt for absent or unusable values instead of
// throwing, so the normalizer can report what was missing.

std::optional<double> to_double(const boost::json::value& value);
std::optional<std::int64_t> to_int64(const boost::json::value& value);

std::optional<double> number(const boost::json::object& object, const char* key);
std::optional<std::int64_t> integer(const boost::json::object& object, const char* key);
std::optional<std::string> text(const boost::json::object& object, const char* key);
// Integers and strings rendered as text; used for ids and epoch tokens.
std::optional<std::string> token(const boost::json::object& object, const char* key);
std::optional<bool> boolean(const boost::json::object& object, const char* key);

}  // namespace adapters::json_fields

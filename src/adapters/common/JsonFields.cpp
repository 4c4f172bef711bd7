#include "adapters/common/JsonFields.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace adapters::json_fields {

std::optional<double> to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        if (str.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(str.c_str(), &end);
        if (errno != 0 || end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::optional<std::int64_t> to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        if (str.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(str.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(parsed);
    }
    return std::nullopt;
}

std::optional<double> number(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return to_double(*value);
}

std::optional<std::int64_t> integer(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return to_int64(*value);
}

std::optional<std::string> text(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return std::string(value->as_string().c_str());
}

std::optional<std::string> token(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return std::string(value->as_string().c_str());
    }
    if (value->is_int64()) {
        return std::to_string(value->as_int64());
    }
    if (value->is_uint64()) {
        return std::to_string(value->as_uint64());
    }
    if (value->is_double()) {
        return std::to_string(std::llround(value->as_double()));
    }
    return std::nullopt;
}

std::optional<bool> boolean(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_bool()) {
        return std::nullopt;
    }
    return value->as_bool();
}

}  // namespace adapters::json_fields

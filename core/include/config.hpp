#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <nlohmann/json.hpp>

#include "exceptions.hpp"

namespace core {
namespace config {

    using json = nlohmann::json;

    // Read and parse a JSON file. Throws ConfigException on I/O or parse errors.
    json loadJsonFile(const std::string& path);

    // Typed access to a required field of a JSON object.
    // 'context' names the enclosing section in error messages (e.g. "walk_forward").
    template<typename T>
    T requireField(const json& object, const std::string& key, const std::string& context) {
        if (!object.is_object() || !object.contains(key)) {
            throw ConfigException("Missing required field '" + context + "." + key + "'");
        }
        try {
            return object.at(key).get<T>();
        } catch (const json::exception& e) {
            throw ConfigException("Field '" + context + "." + key + "' has the wrong type: " + e.what());
        }
    }

    // Typed access to an optional field, falling back to 'fallback' when absent.
    template<typename T>
    T getOr(const json& object, const std::string& key, const T& fallback, const std::string& context) {
        if (!object.is_object() || !object.contains(key) || object.at(key).is_null()) {
            return fallback;
        }
        return requireField<T>(object, key, context);
    }

    // Optional integer field that must fit T and be at least 'min_value'.
    // Unlike getOr<T>(), negative or oversized numbers are rejected instead of wrapping,
    // and fractional numbers are rejected instead of truncated.
    template<typename T>
    T getIntegerOr(const json& object, const std::string& key, T fallback, const std::string& context,
                   std::int64_t min_value = std::numeric_limits<std::int64_t>::min()) {
        static_assert(std::is_integral<T>::value, "getIntegerOr needs an integral type");
        if (!object.is_object() || !object.contains(key) || object.at(key).is_null()) {
            return fallback;
        }
        const json& value = object.at(key);
        const std::string field = context + "." + key;
        if (!value.is_number_integer()) {
            throw ConfigException("Field '" + field + "' must be an integer, got " + value.dump());
        }

        bool in_range = false;
        if (value.is_number_unsigned()) {
            const auto v = value.get<std::uint64_t>();
            in_range = v <= static_cast<std::uint64_t>(std::numeric_limits<T>::max()) &&
                       (min_value <= 0 || v >= static_cast<std::uint64_t>(min_value));
        } else {
            const auto v = value.get<std::int64_t>();
            if (v < 0) {
                in_range = std::is_signed<T>::value &&
                           v >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) && v >= min_value;
            } else {
                in_range = static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<T>::max()) &&
                           v >= min_value;
            }
        }
        if (!in_range) {
            throw ConfigException("Field '" + field + "' is out of range: " + value.dump());
        }
        return value.get<T>();
    }

} // namespace config
} // namespace core

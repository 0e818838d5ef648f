#pragma once

// Json.hpp — small Boost.JSON helpers: typed field access with defaults, pretty printing.

#include <cstdint>
#include <string>
#include <vector>

#include <boost/json.hpp>

namespace Json
{
    // Parses text; throws std::runtime_error with the Boost.JSON message on syntax errors.
    boost::json::value Parse(const std::string &text);

    // Two-space indented, keys in insertion order, trailing newline.
    std::string Pretty(const boost::json::value &v);

    // Field accessors: missing key -> fallback; wrong type -> std::runtime_error naming the key.
    std::string              GetString(const boost::json::object &o, const char *key, const std::string &fallback);
    std::int64_t             GetInt(const boost::json::object &o, const char *key, std::int64_t fallback);
    bool                     GetBool(const boost::json::object &o, const char *key, bool fallback);
    std::vector<std::string> GetStrings(const boost::json::object &o, const char *key,
                                        const std::vector<std::string> &fallback);

    std::string ToString(boost::json::string_view s);

    boost::json::array FromStrings(const std::vector<std::string> &v);
}

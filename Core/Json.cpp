#include "Core/Json.hpp"

#include <cmath>
#include <stdexcept>

namespace
{
    [[noreturn]] void WrongType(const char *key, const char *expected)
    {
        throw std::runtime_error(std::string("field '") + key + "' must be " + expected);
    }

    void Indent(std::string &out, int depth)
    {
        out.append(static_cast<std::size_t>(depth) * 2, ' ');
    }

    void PrettyTo(std::string &out, const boost::json::value &v, int depth)
    {
        switch (v.kind())
        {
            case boost::json::kind::object:
            {
                const auto &obj = v.get_object();
                if (obj.empty())
                {
                    out += "{}";
                    return;
                }
                out += "{\n";
                std::size_t i = 0;
                for (const auto &kv : obj)
                {
                    Indent(out, depth + 1);
                    out += boost::json::serialize(boost::json::value(kv.key()));
                    out += ": ";
                    PrettyTo(out, kv.value(), depth + 1);
                    if (++i < obj.size()) out += ",";
                    out += "\n";
                }
                Indent(out, depth);
                out += "}";
                return;
            }
            case boost::json::kind::array:
            {
                const auto &arr = v.get_array();
                if (arr.empty())
                {
                    out += "[]";
                    return;
                }
                out += "[\n";
                for (std::size_t i = 0; i < arr.size(); ++i)
                {
                    Indent(out, depth + 1);
                    PrettyTo(out, arr[i], depth + 1);
                    if (i + 1 < arr.size()) out += ",";
                    out += "\n";
                }
                Indent(out, depth);
                out += "]";
                return;
            }
            default:
                out += boost::json::serialize(v);
                return;
        }
    }
}

namespace Json
{
    boost::json::value Parse(const std::string &text)
    {
        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
        {
            throw std::runtime_error("invalid JSON: " + ec.message());
        }
        return jv;
    }

    std::string Pretty(const boost::json::value &v)
    {
        std::string out;
        PrettyTo(out, v, 0);
        out += "\n";
        return out;
    }

    std::string ToString(boost::json::string_view s)
    {
        return std::string(s.data(), s.size());
    }

    std::string GetString(const boost::json::object &o, const char *key, const std::string &fallback)
    {
        const auto *p = o.if_contains(key);
        if (p == nullptr || p->is_null()) return fallback;
        if (!p->is_string()) WrongType(key, "a string");
        return ToString(p->get_string());
    }

    std::int64_t GetInt(const boost::json::object &o, const char *key, std::int64_t fallback)
    {
        const auto *p = o.if_contains(key);
        if (p == nullptr || p->is_null()) return fallback;
        if (p->is_int64())  return p->get_int64();
        if (p->is_uint64()) return static_cast<std::int64_t>(p->get_uint64());
        if (p->is_double())
        {
            const double d = p->get_double();
            if (std::floor(d) == d) return static_cast<std::int64_t>(d);
        }
        WrongType(key, "an integer");
    }

    bool GetBool(const boost::json::object &o, const char *key, bool fallback)
    {
        const auto *p = o.if_contains(key);
        if (p == nullptr || p->is_null()) return fallback;
        if (!p->is_bool()) WrongType(key, "a boolean");
        return p->get_bool();
    }

    std::vector<std::string> GetStrings(const boost::json::object &o, const char *key,
                                        const std::vector<std::string> &fallback)
    {
        const auto *p = o.if_contains(key);
        if (p == nullptr || p->is_null()) return fallback;
        if (!p->is_array()) WrongType(key, "an array of strings");

        std::vector<std::string> out;
        for (const auto &e : p->get_array())
        {
            if (!e.is_string()) WrongType(key, "an array of strings");
            out.push_back(ToString(e.get_string()));
        }
        return out;
    }

    boost::json::array FromStrings(const std::vector<std::string> &v)
    {
        boost::json::array arr;
        for (const auto &s : v) arr.emplace_back(boost::json::string_view(s.data(), s.size()));
        return arr;
    }
}

#include "Network/Parsers.hpp"
#include "Core/Cidr.hpp"

#include <algorithm>
#include <sstream>

namespace
{
    bool StartsWith(const std::string &s, const std::string &p)
    {
        return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
    }

    std::string Trim(const std::string &s)
    {
        const auto b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return {};
        const auto e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    struct Columns
    {
        int gateway = 1;
        int flags   = 2;
        int iface   = 3;
    };

    Columns FromHeader(const std::vector<std::string> &hdr)
    {
        Columns c;
        int flags = -1, iface = -1, gw = -1;
        for (int i = 0; i < static_cast<int>(hdr.size()); ++i)
        {
            const auto &h = hdr[static_cast<std::size_t>(i)];
            if (h == "Gateway")                      gw    = i;
            else if (h == "Flags")                   flags = i;
            else if (h == "Netif" || h == "Iface")   iface = i;
        }
        if (gw >= 0)    c.gateway = gw;
        if (flags >= 0) c.flags   = flags;
        if (iface >= 0) c.iface   = iface;
        return c;
    }

    // "key: value" lines of route get / networksetup
    std::optional<std::string> ValueOf(const std::string &line, const std::string &key)
    {
        const std::string t = Trim(line);
        if (!StartsWith(t, key)) return std::nullopt;
        auto f = Parsers::Fields(t.substr(key.size()));
        if (f.empty()) return std::nullopt;
        return f.front();
    }
}

namespace Parsers
{
    std::vector<std::string> Fields(const std::string &line)
    {
        std::vector<std::string> out;
        std::string cur;
        for (char ch : line)
        {
            if (ch == ' ' || ch == '\t' || ch == '\r')
            {
                if (!cur.empty())
                {
                    out.push_back(cur);
                    cur.clear();
                }
            }
            else
            {
                cur.push_back(ch);
            }
        }
        if (!cur.empty()) out.push_back(cur);
        return out;
    }

    std::vector<RouteRow> ParseNetstat(const std::string &text)
    {
        std::vector<RouteRow> rows;
        std::istringstream    in(text);
        std::string           line;
        Columns               cols;
        bool                  v6_section = false;

        while (std::getline(in, line))
        {
            const std::string t = Trim(line);
            if (t.empty()) continue;

            if (t == "Internet:")  { v6_section = false; continue; }
            if (t == "Internet6:") { v6_section = true;  continue; }
            if (StartsWith(t, "Routing tables") || StartsWith(t, "Kernel IP routing table")) continue;

            auto f = Fields(t);
            if (f.front() == "Destination")
            {
                cols = FromHeader(f);
                continue;
            }

            const int need = std::max(cols.gateway, std::max(cols.flags, cols.iface)) + 1;
            if (static_cast<int>(f.size()) < need) continue;

            RouteRow r;
            r.destination = f[0];
            r.gateway     = f[static_cast<std::size_t>(cols.gateway)];
            r.flags       = f[static_cast<std::size_t>(cols.flags)];
            r.iface       = f[static_cast<std::size_t>(cols.iface)];
            r.ipv6        = v6_section
                            || r.destination.find(':') != std::string::npos
                            || r.gateway.find(':') != std::string::npos;
            rows.push_back(std::move(r));
        }
        return rows;
    }

    RouteLookup ParseRouteGet(const std::string &text)
    {
        RouteLookup        res;
        std::istringstream in(text);
        std::string        line;
        while (std::getline(in, line))
        {
            if (auto v = ValueOf(line, "route to:"))        res.destination = *v;
            else if (auto g = ValueOf(line, "gateway:"))    res.gateway     = *g;
            else if (auto i = ValueOf(line, "interface:"))  res.iface       = *i;
        }
        return res;
    }

    std::optional<std::string> ParseIfconfigInet(const std::string &text)
    {
        std::istringstream in(text);
        std::string        line;
        while (std::getline(in, line))
        {
            auto f = Fields(line);
            for (std::size_t i = 0; i + 1 < f.size(); ++i)
            {
                if (f[i] != "inet") continue;
                std::string addr = f[i + 1];
                // Linux net-tools prints "inet addr:1.2.3.4"
                if (StartsWith(addr, "addr:")) addr = addr.substr(5);
                if (Cidr::IsIPv4(addr)) return addr;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseRouterLine(const std::string &text)
    {
        std::istringstream in(text);
        std::string        line;
        while (std::getline(in, line))
        {
            if (!StartsWith(line, "Router:")) continue;
            auto v = ValueOf(line, "Router:");
            if (v && Cidr::IsIPv4(*v)) return v;
        }
        return std::nullopt;
    }
}

#pragma once

// Parsers.hpp — pure parsers for the text printed by netstat, route, ifconfig and networksetup.
// No process execution here: input is captured stdout.

#include <optional>
#include <string>
#include <vector>

namespace Parsers
{
    struct RouteRow
    {
        std::string destination;  // as printed: "default", "10/8", "172.217", "192.168.1.1"
        std::string gateway;      // IP, "link#4", MAC, ...
        std::string flags;
        std::string iface;
        bool        ipv6 = false;
    };

    struct RouteLookup
    {
        std::string destination;
        std::string gateway;  // empty if the route has no gateway (interface route)
        std::string iface;
    };

    /**
     * @brief Parses `netstat -rn`.
     *
     * Column positions come from the "Destination ..." header of each section
     * (Gateway, Flags, Netif or Iface). Rows under "Internet6:" or with ':' in the
     * destination/gateway are marked ipv6. Lines that are too short are skipped.
     */
    std::vector<RouteRow> ParseNetstat(const std::string &text);

    // `route -n get <dest>`: "   gateway: 192.168.1.1" / "  interface: en0" lines.
    RouteLookup ParseRouteGet(const std::string &text);

    // First "inet a.b.c.d" of `ifconfig <if>` output.
    std::optional<std::string> ParseIfconfigInet(const std::string &text);

    // "Router: a.b.c.d" of `networksetup -getinfo <service>` output.
    std::optional<std::string> ParseRouterLine(const std::string &text);

    // Splits on spaces and tabs, dropping empty fields.
    std::vector<std::string> Fields(const std::string &line);
}

#pragma once

// ConnectivityDetector.hpp — does a VPN tunnel currently own the route to the outside?
//
// Two independent signals over a `netstat -rn` snapshot, combined with OR:
//  - default-route-is-tunnel: the first IPv4 default row decides;
//  - private-route-via-tunnel: 10/8 or 172.16/12 routed through a tunnel (split VPNs).

#include "Core/Command.hpp"
#include "Network/Parsers.hpp"

#include <chrono>
#include <string>
#include <vector>

struct InterfacePolicy
{
    std::string              physical_interface = "en0";
    std::vector<std::string> tunnel_prefixes    = { "utun", "ppp", "ipsec", "tun" };

    bool IsTunnel(const std::string &iface) const;
    bool IsPhysical(const std::string &iface) const;
};

struct ConnectivityObservation
{
    bool                                  connected = false;
    std::chrono::system_clock::time_point observed_at;
    std::string                           tunnel_iface;  // best effort, empty if unknown
};

namespace Signals
{
    /**
     * @brief First IPv4 default route decides: tunnel -> true, physical -> false.
     *
     * IPv6 and link-local (fe80::) rows are ignored. Rows through other interfaces
     * (e.g. a second Ethernet port) are skipped. No default route -> false.
     */
    bool DefaultRouteIsTunnel(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy);

    // Any IPv4 route into 10.0.0.0/8 or 172.16.0.0/12 leaving through a tunnel interface.
    bool PrivateRouteViaTunnel(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy);

    // Interface of the first tunnel default route, or of the first private tunnel route.
    std::string TunnelInterface(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy);
}

class ConnectivityDetector
{
public:
    ConnectivityDetector(CommandRunner run, InterfacePolicy policy);

    // Re-reads the routing table on every call. A failed netstat counts as "not connected".
    bool IsConnected() const;

    // Throws DetectionError when the routing table cannot be read.
    ConnectivityObservation Observe() const;

    // `route -n get default` gateway when it leaves through a tunnel, else "".
    std::string TunnelGateway() const;

    const InterfacePolicy &Policy() const { return policy_; }

private:
    std::vector<Parsers::RouteRow> Snapshot_() const;

private:
    CommandRunner   run_;
    InterfacePolicy policy_;
};

#pragma once

// GatewayResolver.hpp — finds the physical (non-tunnel) next hop, with a 5 minute cache.

#include "Core/Command.hpp"
#include "Network/ConnectivityDetector.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct GatewayResolution
{
    std::string address;   // always set; "192.168.1.1" when nothing was found
    bool        detected = false;
    std::string method;    // "override", "cache", "netstat", "route", "networksetup", "ifconfig", "probe", "fallback"
    std::string error;     // non-empty iff !detected
};

class GatewayResolver
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr const char *kFallbackGateway = "192.168.1.1";
    static constexpr std::chrono::minutes kCacheTtl{ 5 };

    /**
     * @param run      command seam
     * @param policy   which interface is physical and which are tunnels
     * @param override_gateway  fixed IPv4 that short-circuits detection ("auto"/empty = detect)
     * @param clock    time source for the cache, steady_clock::now by default
     */
    GatewayResolver(CommandRunner run,
                    InterfacePolicy policy,
                    std::string override_gateway = {},
                    Clock clock = {});

    // Never throws. On total failure returns kFallbackGateway with detected=false.
    GatewayResolution Resolve();

    // Drop the cached value; next Resolve() runs the strategies again.
    void Invalidate();

    void SetOverride(const std::string &gateway);

    // Addresses typical for corporate VPN pools ("10.10", "172.29." ...), rejected as gateways.
    static bool IsBlocklisted(const std::string &ip);

private:
    std::optional<std::string> FromNetstat_();
    std::optional<std::string> FromRouteGet_();
    std::optional<std::string> FromNetworksetup_();
    std::optional<std::string> FromInterfaceAddress_();
    std::optional<std::string> FromCommonGateways_();

    bool Ping_(const std::string &ip);

private:
    CommandRunner   run_;
    InterfacePolicy policy_;
    std::string     override_;
    Clock           clock_;

    std::mutex                            mu_;
    std::string                           cached_;
    std::chrono::steady_clock::time_point cached_at_{};
};

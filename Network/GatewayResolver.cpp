#include "Network/GatewayResolver.hpp"
#include "Network/Parsers.hpp"
#include "Core/Cidr.hpp"
#include "Core/Logger.hpp"

#include <array>

namespace
{
    // Order matters: the first usable answer wins.
    const std::array<const char *, 3> kPrivateProbeNets = {
        "192.168.0.0/16", "10.0.0.0/8", "172.16.0.0/12"
    };

    const std::array<const char *, 2> kNetworkServices = { "Wi-Fi", "Ethernet" };

    const std::array<const char *, 6> kCommonGateways = {
        "192.168.1.1", "192.168.0.1", "10.0.0.1", "192.168.2.1", "10.1.1.1", "172.16.0.1"
    };

    const std::array<const char *, 4> kVpnPoolPrefixes = { "10.10", "172.29.", "172.30.", "172.31." };

    std::string WithLastOctet(const std::string &ip, const char *last)
    {
        const auto dot = ip.rfind('.');
        if (dot == std::string::npos) return {};
        return ip.substr(0, dot + 1) + last;
    }
}

GatewayResolver::GatewayResolver(CommandRunner run,
                                 InterfacePolicy policy,
                                 std::string override_gateway,
                                 Clock clock)
        : run_(std::move(run))
        , policy_(std::move(policy))
        , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
{
    SetOverride(override_gateway);
}

void GatewayResolver::SetOverride(const std::string &gateway)
{
    std::lock_guard<std::mutex> lk(mu_);
    override_ = (gateway == "auto") ? std::string() : gateway;
    cached_.clear();
}

void GatewayResolver::Invalidate()
{
    std::lock_guard<std::mutex> lk(mu_);
    cached_.clear();
    LOGD("gateway") << "Cache invalidated";
}

bool GatewayResolver::IsBlocklisted(const std::string &ip)
{
    for (const char *p : kVpnPoolPrefixes)
    {
        if (ip.rfind(p, 0) == 0) return true;
    }
    return false;
}

GatewayResolution GatewayResolver::Resolve()
{
    std::lock_guard<std::mutex> lk(mu_);
    GatewayResolution res;

    if (!override_.empty())
    {
        res.address  = override_;
        res.detected = true;
        res.method   = "override";
        return res;
    }

    const auto now = clock_();
    if (!cached_.empty() && now - cached_at_ < kCacheTtl)
    {
        res.address  = cached_;
        res.detected = true;
        res.method   = "cache";
        return res;
    }

    struct Strategy
    {
        const char *name;
        std::optional<std::string> (GatewayResolver::*fn)();
    };
    const Strategy strategies[] = {
        { "netstat",      &GatewayResolver::FromNetstat_ },
        { "route",        &GatewayResolver::FromRouteGet_ },
        { "networksetup", &GatewayResolver::FromNetworksetup_ },
        { "ifconfig",     &GatewayResolver::FromInterfaceAddress_ },
        { "probe",        &GatewayResolver::FromCommonGateways_ },
    };

    for (const auto &s : strategies)
    {
        auto gw = (this->*s.fn)();
        if (!gw) continue;

        if (IsBlocklisted(*gw))
        {
            LOGD("gateway") << s.name << ": rejected " << *gw << " (VPN pool)";
            continue;
        }

        cached_    = *gw;
        cached_at_ = now;

        res.address  = *gw;
        res.detected = true;
        res.method   = s.name;
        LOGI("gateway") << "Detected " << *gw << " via " << s.name;
        return res;
    }

    res.address = kFallbackGateway;
    res.method  = "fallback";
    res.error   = "could not detect gateway reliably";
    LOGW("gateway") << res.error << ", falling back to " << res.address;
    return res;
}

std::optional<std::string> GatewayResolver::FromNetstat_()
{
    auto r = run_({ "netstat", "-rn" });
    if (!r.Ok()) return std::nullopt;

    for (const auto &row : Parsers::ParseNetstat(r.out))
    {
        if (row.ipv6 || row.destination != "default") continue;
        if (!policy_.IsPhysical(row.iface)) continue;
        if (Cidr::IsIPv4(row.gateway)) return row.gateway;
    }
    return std::nullopt;
}

std::optional<std::string> GatewayResolver::FromRouteGet_()
{
    for (const char *net : kPrivateProbeNets)
    {
        auto r = run_({ "route", "-n", "get", net });
        if (!r.Ok()) continue;

        auto lk = Parsers::ParseRouteGet(r.out);
        if (policy_.IsTunnel(lk.iface)) continue;
        if (Cidr::IsIPv4(lk.gateway) && Cidr::IsPrivate(lk.gateway)) return lk.gateway;
    }
    return std::nullopt;
}

std::optional<std::string> GatewayResolver::FromNetworksetup_()
{
    for (const char *svc : kNetworkServices)
    {
        auto r = run_({ "networksetup", "-getinfo", svc });
        if (!r.Ok()) continue;

        if (auto gw = Parsers::ParseRouterLine(r.out)) return gw;
    }
    return std::nullopt;
}

std::optional<std::string> GatewayResolver::FromInterfaceAddress_()
{
    auto r = run_({ "ifconfig", policy_.physical_interface });
    if (!r.Ok()) return std::nullopt;

    auto ip = Parsers::ParseIfconfigInet(r.out);
    if (!ip) return std::nullopt;

    for (const char *last : { "1", "254" })
    {
        const std::string cand = WithLastOctet(*ip, last);
        if (cand.empty() || cand == *ip) continue;
        if (Ping_(cand)) return cand;
    }
    return std::nullopt;
}

std::optional<std::string> GatewayResolver::FromCommonGateways_()
{
    for (const char *gw : kCommonGateways)
    {
        if (Ping_(gw)) return std::string(gw);
    }
    return std::nullopt;
}

bool GatewayResolver::Ping_(const std::string &ip)
{
    // one packet, 1000 ms
    return run_({ "ping", "-c", "1", "-W", "1000", ip }).Ok();
}

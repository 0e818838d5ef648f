#include "Network/ConnectivityDetector.hpp"
#include "Core/Cidr.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

namespace
{
    bool IsIPv4Default(const Parsers::RouteRow &r)
    {
        return !r.ipv6 && (r.destination == "default" || r.destination == "0.0.0.0");
    }

    const std::vector<Cidr::Block> &CorporateBlocks()
    {
        static const std::vector<Cidr::Block> blocks = {
            *Cidr::Parse("10.0.0.0/8"),
            *Cidr::Parse("172.16.0.0/12"),
        };
        return blocks;
    }

    bool IsCorporateRoute(const Parsers::RouteRow &r)
    {
        if (r.ipv6 || r.destination == "default") return false;
        auto b = Cidr::ParseDisplay(r.destination);
        if (!b) return false;
        for (const auto &blk : CorporateBlocks())
        {
            if (Cidr::Covers(blk, *b)) return true;
        }
        return false;
    }
}

bool InterfacePolicy::IsTunnel(const std::string &iface) const
{
    for (const auto &p : tunnel_prefixes)
    {
        if (!p.empty() && iface.compare(0, p.size(), p) == 0) return true;
    }
    return false;
}

bool InterfacePolicy::IsPhysical(const std::string &iface) const
{
    return iface == physical_interface;
}

namespace Signals
{
    bool DefaultRouteIsTunnel(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy)
    {
        for (const auto &r : rows)
        {
            if (!IsIPv4Default(r)) continue;
            if (r.gateway.find("fe80::") != std::string::npos) continue;

            if (policy.IsTunnel(r.iface))   return true;
            if (policy.IsPhysical(r.iface)) return false;
        }
        return false;
    }

    bool PrivateRouteViaTunnel(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy)
    {
        for (const auto &r : rows)
        {
            if (policy.IsTunnel(r.iface) && IsCorporateRoute(r)) return true;
        }
        return false;
    }

    std::string TunnelInterface(const std::vector<Parsers::RouteRow> &rows, const InterfacePolicy &policy)
    {
        for (const auto &r : rows)
        {
            if (IsIPv4Default(r) && policy.IsTunnel(r.iface)) return r.iface;
        }
        for (const auto &r : rows)
        {
            if (policy.IsTunnel(r.iface) && IsCorporateRoute(r)) return r.iface;
        }
        return {};
    }
}

ConnectivityDetector::ConnectivityDetector(CommandRunner run, InterfacePolicy policy)
        : run_(std::move(run))
        , policy_(std::move(policy))
{
}

std::vector<Parsers::RouteRow> ConnectivityDetector::Snapshot_() const
{
    auto res = run_({ "netstat", "-rn" });
    if (!res.Ok())
    {
        throw DetectionError("netstat -rn failed rc=" + std::to_string(res.exit_code) + ": " + res.err);
    }
    return Parsers::ParseNetstat(res.out);
}

bool ConnectivityDetector::IsConnected() const
{
    try
    {
        return Observe().connected;
    }
    catch (const DetectionError &e)
    {
        LOGW("vpn") << e.what();
        return false;
    }
}

ConnectivityObservation ConnectivityDetector::Observe() const
{
    ConnectivityObservation obs;
    obs.observed_at = std::chrono::system_clock::now();

    const std::vector<Parsers::RouteRow> rows = Snapshot_();

    const bool by_default = Signals::DefaultRouteIsTunnel(rows, policy_);
    const bool by_private = !by_default && Signals::PrivateRouteViaTunnel(rows, policy_);

    obs.connected = by_default || by_private;
    if (obs.connected)
    {
        obs.tunnel_iface = Signals::TunnelInterface(rows, policy_);
    }

    LOGT("vpn") << "observe: default_tunnel=" << by_default
                << " private_tunnel=" << by_private
                << " iface=" << obs.tunnel_iface;
    return obs;
}

std::string ConnectivityDetector::TunnelGateway() const
{
    auto res = run_({ "route", "-n", "get", "default" });
    if (!res.Ok()) return {};

    auto lk = Parsers::ParseRouteGet(res.out);
    if (!policy_.IsTunnel(lk.iface)) return {};
    return lk.gateway;
}

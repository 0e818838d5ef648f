#include "Network/GatewayResolver.hpp"
#include "FakeHost.hpp"

#include <gtest/gtest.h>

namespace
{
    struct ManualClock
    {
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point(std::chrono::hours(1));

        GatewayResolver::Clock Fn()
        {
            return [this] { return now; };
        }
    };

    // Every strategy before `ifconfig` comes up empty.
    void BlindHost(FakeHost &host)
    {
        host.SetVpn(FakeHost::Vpn::Full);
        host.SetPhysicalDefault(false);
        host.SetRouter("");
    }
}

TEST(GatewayResolver, PhysicalDefaultFromNetstat)
{
    FakeHost host;
    host.SetVpn(FakeHost::Vpn::Full);
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_TRUE(gw.detected);
    EXPECT_EQ(gw.address, "192.168.1.1");
    EXPECT_EQ(gw.method, "netstat");
    EXPECT_TRUE(gw.error.empty());
}

TEST(GatewayResolver, OverrideSkipsDetection)
{
    FakeHost        host;
    GatewayResolver res(host.Runner(), InterfacePolicy{}, "192.168.50.1");

    auto gw = res.Resolve();
    EXPECT_TRUE(gw.detected);
    EXPECT_EQ(gw.address, "192.168.50.1");
    EXPECT_EQ(gw.method, "override");
    EXPECT_TRUE(host.Calls().empty());

    res.SetOverride("auto");
    EXPECT_EQ(res.Resolve().method, "netstat");
}

TEST(GatewayResolver, CachesForFiveMinutes)
{
    FakeHost        host;
    ManualClock     clock;
    GatewayResolver res(host.Runner(), InterfacePolicy{}, {}, clock.Fn());

    EXPECT_EQ(res.Resolve().method, "netstat");
    clock.now += std::chrono::minutes(4);
    auto cached = res.Resolve();
    EXPECT_EQ(cached.method, "cache");
    EXPECT_EQ(cached.address, "192.168.1.1");
    EXPECT_EQ(host.CountCalls("netstat"), 1u);

    clock.now += std::chrono::minutes(2);
    EXPECT_EQ(res.Resolve().method, "netstat");
    EXPECT_EQ(host.CountCalls("netstat"), 2u);
}

TEST(GatewayResolver, InvalidateForcesDetection)
{
    FakeHost        host;
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    res.Resolve();
    host.SetPhysicalGateway("192.168.0.254");
    EXPECT_EQ(res.Resolve().address, "192.168.1.1");

    res.Invalidate();
    auto gw = res.Resolve();
    EXPECT_EQ(gw.address, "192.168.0.254");
    EXPECT_EQ(gw.method, "netstat");
}

TEST(GatewayResolver, VpnPoolAddressesAreRejected)
{
    FakeHost host;
    host.SetPhysicalGateway("10.10.0.1");
    host.SetRouter("192.168.1.254");
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_TRUE(gw.detected);
    EXPECT_EQ(gw.address, "192.168.1.254");
    EXPECT_EQ(gw.method, "networksetup");
}

TEST(GatewayResolver, RouteGetSkipsTunnelAnswers)
{
    FakeHost host;
    host.SetVpn(FakeHost::Vpn::Split);
    host.SetPhysicalDefault(false);
    host.Script({ "route", "-n", "get", "192.168.0.0/16" },
                FakeHost::Ok("   route to: 192.168.0.0\n    gateway: 10.8.0.1\n  interface: utun3\n"));
    host.Script({ "route", "-n", "get", "172.16.0.0/12" },
                FakeHost::Ok("   route to: 172.16.0.0\n    gateway: 172.16.0.1\n  interface: en0\n"));
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_EQ(gw.address, "172.16.0.1");
    EXPECT_EQ(gw.method, "route");
}

TEST(GatewayResolver, InterfaceAddressGuess)
{
    FakeHost host;
    BlindHost(host);
    host.SetReachable({ "192.168.1.254" });
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_TRUE(gw.detected);
    EXPECT_EQ(gw.address, "192.168.1.254");
    EXPECT_EQ(gw.method, "ifconfig");
}

TEST(GatewayResolver, CommonGatewayProbe)
{
    FakeHost host;
    BlindHost(host);
    host.SetInterfaceAddress("");
    host.SetReachable({ "10.0.0.1", "172.16.0.1" });
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_EQ(gw.address, "10.0.0.1");
    EXPECT_EQ(gw.method, "probe");
}

TEST(GatewayResolver, FallbackWhenNothingAnswers)
{
    FakeHost host;
    BlindHost(host);
    GatewayResolver res(host.Runner(), InterfacePolicy{});

    auto gw = res.Resolve();
    EXPECT_FALSE(gw.detected);
    EXPECT_EQ(gw.address, GatewayResolver::kFallbackGateway);
    EXPECT_EQ(gw.method, "fallback");
    EXPECT_FALSE(gw.error.empty());

    // failures are not cached
    host.SetReachable({ "192.168.1.1" });
    auto again = res.Resolve();
    EXPECT_TRUE(again.detected);
    EXPECT_EQ(again.method, "ifconfig");
}

TEST(GatewayResolver, Blocklist)
{
    EXPECT_TRUE(GatewayResolver::IsBlocklisted("10.10.5.1"));
    EXPECT_TRUE(GatewayResolver::IsBlocklisted("172.29.0.1"));
    EXPECT_TRUE(GatewayResolver::IsBlocklisted("172.31.255.1"));
    EXPECT_FALSE(GatewayResolver::IsBlocklisted("192.168.1.1"));
    EXPECT_FALSE(GatewayResolver::IsBlocklisted("172.16.0.1"));
}

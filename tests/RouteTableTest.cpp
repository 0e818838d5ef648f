#include "Network/RouteTable.hpp"
#include "Core/Errors.hpp"
#include "FakeHost.hpp"

#include <gtest/gtest.h>

class RouteTableTest : public ::testing::Test
{
protected:
    FakeHost   host;
    RouteTable table{ host.Runner() };
};

TEST_F(RouteTableTest, AddInstallsAndTracks)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");

    EXPECT_TRUE(host.HasRoute("91.108.4.0/22"));
    EXPECT_EQ(host.GatewayOf("91.108.4.0/22"), "192.168.1.1");
    ASSERT_EQ(table.Count(), 1u);

    auto routes = table.ActiveRoutes();
    EXPECT_EQ(routes[0].network, "91.108.4.0/22");
    EXPECT_EQ(routes[0].gateway, "192.168.1.1");
    EXPECT_EQ(routes[0].service, "telegram");
    EXPECT_EQ(table.CountForService("telegram"), 1u);
}

TEST_F(RouteTableTest, AddIsIdempotent)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("91.108.4.0/22", "192.168.1.1", "other");

    EXPECT_EQ(host.CountCalls("route", "add"), 1u);
    EXPECT_EQ(table.Count(), 1u);
    EXPECT_EQ(table.ActiveRoutes()[0].service, "telegram");
}

TEST_F(RouteTableTest, GatewayChangeReplacesRoute)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("91.108.4.0/22", "192.168.0.1", "telegram");

    EXPECT_EQ(host.GatewayOf("91.108.4.0/22"), "192.168.0.1");
    EXPECT_EQ(host.CountCalls("route", "delete"), 1u);
    EXPECT_EQ(host.CountCalls("route", "add"), 2u);
    ASSERT_EQ(table.Count(), 1u);
    EXPECT_EQ(table.ActiveRoutes()[0].gateway, "192.168.0.1");
}

TEST_F(RouteTableTest, RejectsInvalidInputWithoutTouchingTheOs)
{
    EXPECT_THROW(table.Add("91.108.4.0", "192.168.1.1", "telegram"), RouteError);
    EXPECT_THROW(table.Add("91.108.4.0/22", "not-an-ip", "telegram"), RouteError);
    EXPECT_THROW(table.Remove("garbage"), RouteError);
    EXPECT_TRUE(host.Calls().empty());
    EXPECT_EQ(table.Count(), 0u);
}

TEST_F(RouteTableTest, AdoptsExistingOsRoute)
{
    host.InstallRoute("91.108.4.0/22", "192.168.1.1");

    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");

    EXPECT_EQ(host.CountCalls("route", "add"), 2u);
    EXPECT_EQ(host.CountCalls("route", "delete"), 1u);
    EXPECT_TRUE(host.HasRoute("91.108.4.0/22"));
    EXPECT_EQ(table.Count(), 1u);
}

TEST_F(RouteTableTest, FailedAddThrowsAndIsNotTracked)
{
    host.FailAdd("91.108.4.0/22");

    try
    {
        table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
        FAIL() << "expected RouteError";
    }
    catch (const RouteError &e)
    {
        ASSERT_EQ(e.Networks().size(), 1u);
        EXPECT_EQ(e.Networks()[0], "91.108.4.0/22");
        EXPECT_NE(std::string(e.what()).find("Network is unreachable"), std::string::npos);
    }
    EXPECT_EQ(table.Count(), 0u);
}

TEST_F(RouteTableTest, RemoveDeletesAndForgets)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Remove("91.108.4.0/22");

    EXPECT_FALSE(host.HasRoute("91.108.4.0/22"));
    EXPECT_EQ(table.Count(), 0u);
}

TEST_F(RouteTableTest, RemoveOfAbsentRouteSucceeds)
{
    EXPECT_NO_THROW(table.Remove("91.108.4.0/22"));

    // untracked but present in the OS: still deleted
    host.InstallRoute("149.154.160.0/20", "192.168.1.1");
    EXPECT_NO_THROW(table.Remove("149.154.160.0/20"));
    EXPECT_FALSE(host.HasRoute("149.154.160.0/20"));
}

TEST_F(RouteTableTest, FailedRemoveKeepsEntry)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    host.FailDelete("91.108.4.0/22");

    EXPECT_THROW(table.Remove("91.108.4.0/22"), RouteError);
    EXPECT_EQ(table.Count(), 1u);
}

TEST_F(RouteTableTest, RemoveAllForgetsEverythingAndReportsFailures)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("149.154.160.0/20", "192.168.1.1", "telegram");
    table.Add("172.217.0.0/16", "192.168.1.1", "youtube");
    host.FailDelete("149.154.160.0/20");

    try
    {
        table.RemoveAll();
        FAIL() << "expected RouteError";
    }
    catch (const RouteError &e)
    {
        ASSERT_EQ(e.Networks().size(), 1u);
        EXPECT_EQ(e.Networks()[0], "149.154.160.0/20");
    }

    EXPECT_EQ(table.Count(), 0u);
    EXPECT_FALSE(host.HasRoute("91.108.4.0/22"));
    EXPECT_FALSE(host.HasRoute("172.217.0.0/16"));
    EXPECT_TRUE(host.HasRoute("149.154.160.0/20"));
}

TEST_F(RouteTableTest, RemoveServiceOnlyTouchesItsRoutes)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("172.217.0.0/16", "192.168.1.1", "youtube");
    table.Add("142.250.0.0/15", "192.168.1.1", "youtube");

    table.RemoveService("youtube");

    EXPECT_EQ(table.Count(), 1u);
    EXPECT_EQ(table.CountForService("youtube"), 0u);
    EXPECT_TRUE(host.HasRoute("91.108.4.0/22"));
    EXPECT_FALSE(host.HasRoute("172.217.0.0/16"));
}

TEST_F(RouteTableTest, VerifyMatchesNetstatDisplayForms)
{
    const std::vector<std::string> nets = {
        "172.217.0.0/16", "100.64.0.0/10", "185.76.151.0/24", "1.2.3.4/32", "17.0.0.0/8"
    };
    for (const auto &n : nets) table.Add(n, "192.168.1.1", "svc");

    auto all = table.VerifyAll();
    ASSERT_EQ(all.size(), nets.size());
    for (const auto &n : nets)
    {
        EXPECT_TRUE(all[n]) << n;
        EXPECT_TRUE(table.Verify(n)) << n;
    }
}

TEST_F(RouteTableTest, VerifyDetectsMissingOrRedirectedRoutes)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("172.217.0.0/16", "192.168.1.1", "youtube");

    host.DropRoute("91.108.4.0/22");
    host.InstallRoute("172.217.0.0/16", "10.8.0.1");

    EXPECT_FALSE(table.Verify("91.108.4.0/22"));
    EXPECT_FALSE(table.Verify("172.217.0.0/16"));
    EXPECT_FALSE(table.Verify("8.8.8.0/24"));

    host.SetNetstatFails(true);
    auto all = table.VerifyAll();
    EXPECT_FALSE(all["91.108.4.0/22"]);
}

TEST_F(RouteTableTest, RestoreReinstallsTowardNewGateway)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    table.Add("172.217.0.0/16", "192.168.1.1", "youtube");
    host.DropRoute("91.108.4.0/22");

    table.Restore("192.168.0.1", { "91.108.4.0/22", "8.8.8.0/24" });

    EXPECT_EQ(host.GatewayOf("91.108.4.0/22"), "192.168.0.1");
    EXPECT_EQ(host.GatewayOf("172.217.0.0/16"), "192.168.1.1");
    EXPECT_FALSE(host.HasRoute("8.8.8.0/24"));
    EXPECT_TRUE(table.Verify("91.108.4.0/22"));
}

TEST_F(RouteTableTest, RestoreReportsFailures)
{
    table.Add("91.108.4.0/22", "192.168.1.1", "telegram");
    host.DropRoute("91.108.4.0/22");
    host.FailAdd("91.108.4.0/22");

    EXPECT_THROW(table.Restore("192.168.1.1"), RouteError);
    EXPECT_THROW(table.Restore("bogus"), RouteError);
}

TEST_F(RouteTableTest, PurgeStaleDeletesOnlyUntrackedLeftovers)
{
    host.InstallRoute("91.108.4.0/22", "192.168.1.1");
    host.InstallRoute("149.154.160.0/20", "192.168.0.1");
    table.Add("172.217.0.0/16", "192.168.1.1", "youtube");

    const auto purged = table.PurgeStale({ "91.108.4.0/22", "149.154.160.0/20", "172.217.0.0/16", "8.8.8.0/24" },
                                         "192.168.1.1");

    EXPECT_EQ(purged, 1u);
    EXPECT_FALSE(host.HasRoute("91.108.4.0/22"));
    EXPECT_TRUE(host.HasRoute("149.154.160.0/20"));
    EXPECT_TRUE(host.HasRoute("172.217.0.0/16"));
    EXPECT_EQ(table.Count(), 1u);
}

#include "Network/Parsers.hpp"

#include <gtest/gtest.h>

namespace
{
    const char *kMacNetstat =
            "Routing tables\n"
            "\n"
            "Internet:\n"
            "Destination        Gateway            Flags           Netif Expire\n"
            "default            link#22            UCSg            utun3\n"
            "default            192.168.1.1        UGScIg            en0\n"
            "10/8               link#22            UCS             utun3\n"
            "172.217            192.168.1.1        UGSc              en0\n"
            "192.168.1          link#6             UCS               en0      !\n"
            "192.168.1.1/32     link#6             UCS               en0      !\n"
            "\n"
            "Internet6:\n"
            "Destination                             Gateway                                 Flags           Netif Expire\n"
            "default                                 fe80::%utun0                            UGcIg           utun0\n"
            "::1                                     ::1                                     UHL               lo0\n";

    const char *kLinuxNetstat =
            "Kernel IP routing table\n"
            "Destination     Gateway         Genmask         Flags   MSS Window  irtt Iface\n"
            "0.0.0.0         192.168.1.1     0.0.0.0         UG        0 0          0 wlan0\n"
            "10.8.0.0        0.0.0.0         255.255.255.0   U         0 0          0 tun0\n";
}

TEST(Parsers, NetstatMacSectionsAndColumns)
{
    auto rows = Parsers::ParseNetstat(kMacNetstat);
    ASSERT_EQ(rows.size(), 8u);

    EXPECT_EQ(rows[0].destination, "default");
    EXPECT_EQ(rows[0].gateway, "link#22");
    EXPECT_EQ(rows[0].iface, "utun3");
    EXPECT_FALSE(rows[0].ipv6);

    EXPECT_EQ(rows[1].gateway, "192.168.1.1");
    EXPECT_EQ(rows[1].flags, "UGScIg");
    EXPECT_EQ(rows[1].iface, "en0");

    EXPECT_EQ(rows[3].destination, "172.217");

    EXPECT_TRUE(rows[6].ipv6);
    EXPECT_EQ(rows[6].iface, "utun0");
    EXPECT_TRUE(rows[7].ipv6);
}

TEST(Parsers, NetstatLinuxHeaderUsesIfaceColumn)
{
    auto rows = Parsers::ParseNetstat(kLinuxNetstat);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].destination, "0.0.0.0");
    EXPECT_EQ(rows[0].gateway, "192.168.1.1");
    EXPECT_EQ(rows[0].flags, "UG");
    EXPECT_EQ(rows[0].iface, "wlan0");
    EXPECT_EQ(rows[1].iface, "tun0");
}

TEST(Parsers, NetstatSkipsShortAndEmptyLines)
{
    auto rows = Parsers::ParseNetstat("Internet:\n"
                                      "Destination Gateway Flags Netif\n"
                                      "broken\n"
                                      "\n"
                                      "default 192.168.1.1 UGSc en0\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].iface, "en0");
    EXPECT_TRUE(Parsers::ParseNetstat("").empty());
}

TEST(Parsers, RouteGet)
{
    auto lk = Parsers::ParseRouteGet("   route to: default\n"
                                     "destination: default\n"
                                     "       mask: default\n"
                                     "    gateway: 192.168.1.1\n"
                                     "  interface: en0\n"
                                     "      flags: <UP,GATEWAY,DONE,STATIC,PRCLONING>\n");
    EXPECT_EQ(lk.destination, "default");
    EXPECT_EQ(lk.gateway, "192.168.1.1");
    EXPECT_EQ(lk.iface, "en0");

    auto none = Parsers::ParseRouteGet("route: route has not been found\n");
    EXPECT_TRUE(none.gateway.empty());
    EXPECT_TRUE(none.iface.empty());
}

TEST(Parsers, IfconfigInetMacAndLinux)
{
    auto mac = Parsers::ParseIfconfigInet("en0: flags=8863<UP,BROADCAST> mtu 1500\n"
                                          "\tinet6 fe80::1%en0 prefixlen 64\n"
                                          "\tinet 192.168.1.23 netmask 0xffffff00 broadcast 192.168.1.255\n");
    ASSERT_TRUE(mac);
    EXPECT_EQ(*mac, "192.168.1.23");

    auto lnx = Parsers::ParseIfconfigInet("eth0  Link encap:Ethernet\n"
                                          "      inet addr:10.0.2.15  Bcast:10.0.2.255  Mask:255.255.255.0\n");
    ASSERT_TRUE(lnx);
    EXPECT_EQ(*lnx, "10.0.2.15");

    EXPECT_FALSE(Parsers::ParseIfconfigInet("en0: flags=8822<BROADCAST> mtu 1500\n"));
}

TEST(Parsers, RouterLine)
{
    auto gw = Parsers::ParseRouterLine("DHCP Configuration\nIP address: 192.168.1.23\nRouter: 192.168.1.1\n");
    ASSERT_TRUE(gw);
    EXPECT_EQ(*gw, "192.168.1.1");

    EXPECT_FALSE(Parsers::ParseRouterLine("Manual Configuration\nRouter: none\n"));
    EXPECT_FALSE(Parsers::ParseRouterLine("There is no Ethernet service.\n"));
}

TEST(Parsers, Fields)
{
    auto f = Parsers::Fields("  a\tb   c \r");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[2], "c");
    EXPECT_TRUE(Parsers::Fields("   ").empty());
}

#include "Service/Config.hpp"
#include "Core/Errors.hpp"
#include "Core/Json.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>

class ConfigTest : public ::testing::Test
{
protected:
    ConfigManager Manager() const
    {
        return ConfigManager(dir / "config/config.json", dir / "config/services");
    }

    TempDir dir;
};

namespace
{
    std::vector<std::string> Keys(const std::vector<std::pair<std::string, ServiceDefinition>> &v)
    {
        std::vector<std::string> out;
        for (const auto &kv : v) out.push_back(kv.first);
        return out;
    }
}

TEST_F(ConfigTest, DefaultsWhenNothingOnDisk)
{
    auto cm = Manager();
    cm.Load();

    const Config &c = cm.Get();
    EXPECT_EQ(c.gateway, "auto");
    EXPECT_EQ(c.check_interval, 5);
    EXPECT_EQ(c.physical_interface, "en0");
    EXPECT_FALSE(c.verify_routes);
    EXPECT_EQ(c.services.size(), 8u);
    EXPECT_EQ(Keys(EnabledByPriority(c.services)), (std::vector<std::string>{ "telegram", "youtube" }));
}

TEST_F(ConfigTest, BuiltInCatalogIsValid)
{
    Config c    = DefaultConfig();
    c.services  = DefaultServices();
    EXPECT_NO_THROW(ValidateConfig(c));

    // facebook and instagram share the Meta ranges
    EXPECT_EQ(c.services["facebook"].networks, c.services["instagram"].networks);
}

TEST_F(ConfigTest, ConfigFileServicesReplaceCatalog)
{
    dir.WriteFile("config/config.json", R"({
        "gateway": "192.168.0.1",
        "check_interval": 10,
        "verify_routes": true,
        "services": {
            "corp": { "name": "Corp", "enabled": true, "priority": 5,
                      "networks": ["203.0.113.0/24", "198.51.100.0/24", "203.0.113.0/24"] }
        }
    })");

    auto cm = Manager();
    cm.Load();

    const Config &c = cm.Get();
    EXPECT_EQ(c.gateway, "192.168.0.1");
    EXPECT_EQ(c.check_interval, 10);
    EXPECT_TRUE(c.verify_routes);
    ASSERT_EQ(c.services.size(), 1u);
    // duplicates dropped, first occurrence kept
    EXPECT_EQ(c.services.at("corp").networks,
              (std::vector<std::string>{ "203.0.113.0/24", "198.51.100.0/24" }));
}

TEST_F(ConfigTest, ServiceFilesOverlayCatalog)
{
    dir.WriteFile("config/services/telegram.json", R"({
        "telegram": { "name": "Telegram", "enabled": false, "priority": 100, "networks": ["91.108.4.0/22"] }
    })");
    dir.WriteFile("config/services/extra.json", R"({
        "name": "Extra", "enabled": true, "priority": 200, "networks": ["203.0.113.0/24"]
    })");
    dir.WriteFile("config/services/broken.json", "{ nope");
    dir.WriteFile("config/services/README.txt", "ignored");

    auto cm = Manager();
    cm.Load();

    const Config &c = cm.Get();
    EXPECT_EQ(c.services.size(), 9u);
    EXPECT_FALSE(c.services.at("telegram").enabled);
    EXPECT_EQ(c.services.at("telegram").networks.size(), 1u);
    EXPECT_EQ(c.services.count("broken"), 0u);
    EXPECT_EQ(Keys(EnabledByPriority(c.services)), (std::vector<std::string>{ "extra", "youtube" }));
}

TEST_F(ConfigTest, InvalidConfigurationsAreRejected)
{
    const char *bad[] = {
        "{ not json",
        "[]",
        R"({"check_interval": 0})",
        R"({"check_interval": "five"})",
        R"({"gateway": "router.local"})",
        R"({"services": {"x": {"name": "X", "enabled": true, "networks": ["1.2.3.4"]}}})",
        R"({"services": {"x": {"name": "", "networks": ["1.2.3.0/24"]}}})",
        R"({"services": {"x": {"name": "X", "networks": []}}})",
        R"({"services": {"x": {"name": "X", "priority": 5000, "networks": ["1.2.3.0/24"]}}})",
        R"({"services": {"x": 3}})",
    };

    for (const char *text : bad)
    {
        dir.WriteFile("config/config.json", text);
        auto cm = Manager();
        EXPECT_THROW(cm.Load(), ConfigError) << text;
    }
}

TEST_F(ConfigTest, EnableDisablePersistThroughServiceFiles)
{
    {
        auto cm = Manager();
        cm.Load();
        cm.EnableService("whatsapp");
        cm.DisableService("youtube");
        EXPECT_TRUE(cm.Get().services.at("whatsapp").enabled);
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "config/services/whatsapp.json"));

    auto cm = Manager();
    cm.Load();
    EXPECT_EQ(Keys(EnabledByPriority(cm.Get().services)), (std::vector<std::string>{ "telegram", "whatsapp" }));
}

TEST_F(ConfigTest, UnknownServiceName)
{
    auto cm = Manager();
    cm.Load();
    EXPECT_THROW(cm.EnableService("myspace"), ConfigError);
}

TEST_F(ConfigTest, SaveAndReload)
{
    auto cm = Manager();
    cm.Load();

    Config c         = cm.Get();
    c.check_interval = 30;
    c.gateway        = "192.168.0.1";
    c.tunnel_prefixes = { "wg", "utun" };
    cm.Set(c);
    cm.Save();

    auto again = Manager();
    again.Load();
    EXPECT_EQ(again.Get().check_interval, 30);
    EXPECT_EQ(again.Get().gateway, "192.168.0.1");
    EXPECT_EQ(again.Get().tunnel_prefixes, (std::vector<std::string>{ "wg", "utun" }));
    EXPECT_EQ(again.Get().services.size(), 8u);
    EXPECT_EQ(again.Get().services.at("telegram").networks, c.services.at("telegram").networks);
}

TEST_F(ConfigTest, SetValidates)
{
    auto cm = Manager();
    cm.Load();

    Config c         = cm.Get();
    c.check_interval = 301;
    EXPECT_THROW(cm.Set(c), ConfigError);
    EXPECT_EQ(cm.Get().check_interval, 5);
}

TEST(EnabledByPriority, HighestFirstThenByKey)
{
    std::map<std::string, ServiceDefinition> m;
    auto add = [&m](const std::string &key, int prio, bool enabled)
    {
        ServiceDefinition s;
        s.name     = key;
        s.priority = prio;
        s.enabled  = enabled;
        s.networks = { "203.0.113.0/24" };
        m[key]     = s;
    };
    add("b", 70, true);
    add("a", 70, true);
    add("z", 100, true);
    add("off", 500, false);

    EXPECT_EQ(Keys(EnabledByPriority(m)), (std::vector<std::string>{ "z", "a", "b" }));
}

TEST(ServiceJson, RoundTripKeepsDomainsAndDescription)
{
    auto jv = Json::Parse(R"({"name":"T","description":"d","enabled":true,"priority":7,
                              "networks":["91.108.4.0/22"],"domains":["t.me"]})");
    const ServiceDefinition s = ServiceFromJson(jv.as_object());
    EXPECT_EQ(s.description, "d");
    EXPECT_EQ(s.domains, (std::vector<std::string>{ "t.me" }));

    const ServiceDefinition back = ServiceFromJson(ServiceToJson(s).as_object());
    EXPECT_EQ(back.name, s.name);
    EXPECT_EQ(back.priority, 7);
    EXPECT_EQ(back.networks, s.networks);
}

#include "Service/Config.hpp"
#include "Core/AtomicFile.hpp"
#include "Core/Cidr.hpp"
#include "Core/Errors.hpp"
#include "Core/Json.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    std::string HomeDir()
    {
        if (const char *h = std::getenv("HOME"); h != nullptr && *h != '\0')
        {
            return h;
        }
        if (const passwd *pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr)
        {
            return pw->pw_dir;
        }
        return "/tmp";
    }

    std::vector<std::string> Dedup(const std::vector<std::string> &in)
    {
        std::vector<std::string> out;
        std::set<std::string>    seen;
        for (const auto &s : in)
        {
            if (seen.insert(s).second) out.push_back(s);
        }
        return out;
    }

    ServiceDefinition Make(const char *name, const char *description, bool enabled, int priority,
                           std::vector<std::string> networks, std::vector<std::string> domains)
    {
        ServiceDefinition s;
        s.name        = name;
        s.description = description;
        s.enabled     = enabled;
        s.priority    = priority;
        s.networks    = std::move(networks);
        s.domains     = std::move(domains);
        return s;
    }

    // Meta ranges shared by facebook and instagram
    std::vector<std::string> MetaNetworks()
    {
        return {
            "31.13.24.0/21",  "31.13.64.0/18",  "45.64.40.0/22",   "66.220.0.0/16",
            "69.63.176.0/20", "69.171.0.0/16",  "74.119.76.0/22",  "102.132.96.0/20",
            "103.4.96.0/22",  "129.134.0.0/16", "157.240.0.0/16",  "173.252.64.0/18",
            "179.60.192.0/22", "185.60.216.0/22", "204.15.20.0/22",
        };
    }

    std::vector<std::string> GoogleNetworks()
    {
        return {
            "172.217.0.0/16", "142.250.0.0/15", "216.58.192.0/19", "74.125.0.0/16",
            "64.233.160.0/19", "66.249.80.0/20", "72.14.192.0/18", "209.85.128.0/17",
        };
    }
}

namespace Paths
{
    std::string BaseDir()     { return (fs::path(HomeDir()) / ".splitroute").string(); }
    std::string ConfigFile()  { return (fs::path(BaseDir()) / "config" / "config.json").string(); }
    std::string ServicesDir() { return (fs::path(BaseDir()) / "config" / "services").string(); }
    std::string LogDir()      { return (fs::path(BaseDir()) / "logs").string(); }
    std::string StateDir()    { return (fs::path(BaseDir()) / "state").string(); }
}

Config DefaultConfig()
{
    Config c;
    c.log_dir   = Paths::LogDir();
    c.state_dir = Paths::StateDir();
    return c;
}

std::map<std::string, ServiceDefinition> DefaultServices()
{
    std::map<std::string, ServiceDefinition> m;

    m["telegram"] = Make("Telegram", "Telegram messaging service", true, 100,
                         { "149.154.160.0/20", "149.154.164.0/22", "149.154.168.0/22", "149.154.172.0/22",
                           "91.108.4.0/22", "91.108.8.0/22", "91.108.12.0/22", "91.108.16.0/22",
                           "91.108.56.0/22", "185.76.151.0/24", "95.161.64.0/20" },
                         { "telegram.org", "web.telegram.org", "api.telegram.org" });

    m["youtube"] = Make("YouTube", "YouTube and Google services", true, 90,
                        GoogleNetworks(),
                        { "youtube.com", "googlevideo.com", "google.com" });

    m["whatsapp"] = Make("WhatsApp", "WhatsApp messaging service", false, 80,
                         { "31.13.64.0/18", "31.13.24.0/21", "31.13.64.0/19", "31.13.96.0/19",
                           "157.240.0.0/16", "173.252.64.0/18", "179.60.192.0/22", "18.194.0.0/15",
                           "34.224.0.0/12" },
                         { "whatsapp.com", "whatsapp.net", "wa.me" });

    m["spotify"] = Make("Spotify", "Spotify music streaming service", false, 70,
                        { "78.31.8.0/21", "193.182.8.0/21", "194.68.28.0/22", "34.64.0.0/10",
                          "35.184.0.0/13", "35.192.0.0/14", "35.196.0.0/15", "104.154.0.0/15",
                          "104.196.0.0/14", "104.199.64.0/18", "35.186.224.0/20" },
                        { "spotify.com", "spclient.wg.spotify.com", "audio-ak-spotify-com.akamaized.net" });

    m["apple-music"] = Make("Apple Music", "Apple Music streaming service", false, 70,
                            { "17.0.0.0/8", "139.178.128.0/17", "144.178.0.0/18", "63.92.224.0/19",
                              "198.183.16.0/20", "65.199.22.0/23", "192.35.50.0/24", "204.79.190.0/24" },
                            { "music.apple.com", "itunes.apple.com", "audio-ssl.itunes.apple.com",
                              "streamingaudio.itunes.apple.com" });

    m["facebook"] = Make("Facebook", "Facebook social network", false, 60,
                         MetaNetworks(),
                         { "facebook.com", "fb.com", "fbcdn.net", "facebook.net" });

    m["instagram"] = Make("Instagram", "Instagram social network", false, 60,
                          MetaNetworks(),
                          { "instagram.com", "cdninstagram.com", "instagramstatic-a.akamaihd.net" });

    auto ytm = GoogleNetworks();
    ytm.push_back("34.64.0.0/10");
    ytm.push_back("35.184.0.0/13");
    m["youtube-music"] = Make("YouTube Music", "YouTube Music streaming service", false, 70,
                              std::move(ytm),
                              { "music.youtube.com", "youtubei.googleapis.com", "youtube.com" });

    return m;
}

void ValidateService(const std::string &key, const ServiceDefinition &svc)
{
    const std::string where = "service '" + key + "': ";

    if (svc.name.empty())
    {
        throw ConfigError(where + "service name cannot be empty");
    }
    if (svc.networks.empty())
    {
        throw ConfigError(where + "service must have at least one network");
    }
    for (const auto &n : svc.networks)
    {
        if (!Cidr::Parse(n))
        {
            throw ConfigError(where + "invalid network CIDR '" + n + "'");
        }
    }
    if (svc.priority < 0 || svc.priority > 1000)
    {
        throw ConfigError(where + "priority must be between 0 and 1000");
    }
}

void ValidateConfig(const Config &cfg)
{
    if (!cfg.gateway.empty() && cfg.gateway != "auto" && !Cidr::IsIPv4(cfg.gateway))
    {
        throw ConfigError("invalid gateway IP: " + cfg.gateway);
    }
    if (cfg.check_interval < 1 || cfg.check_interval > 300)
    {
        throw ConfigError("check_interval must be between 1 and 300 seconds");
    }
    if (cfg.log_dir.empty())
    {
        throw ConfigError("log_dir cannot be empty");
    }
    if (cfg.state_dir.empty())
    {
        throw ConfigError("state_dir cannot be empty");
    }
    if (cfg.physical_interface.empty())
    {
        throw ConfigError("physical_interface cannot be empty");
    }
    if (cfg.shutdown_grace < 1)
    {
        throw ConfigError("shutdown_grace must be at least 1 second");
    }
    for (const auto &[key, svc] : cfg.services)
    {
        ValidateService(key, svc);
    }
}

std::vector<std::pair<std::string, ServiceDefinition>>
EnabledByPriority(const std::map<std::string, ServiceDefinition> &services)
{
    std::vector<std::pair<std::string, ServiceDefinition>> out;
    for (const auto &kv : services)
    {
        if (kv.second.enabled) out.push_back(kv);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const auto &a, const auto &b)
                     {
                         if (a.second.priority != b.second.priority)
                         {
                             return a.second.priority > b.second.priority;
                         }
                         return a.first < b.first;
                     });
    return out;
}

ServiceDefinition ServiceFromJson(const boost::json::object &o)
{
    ServiceDefinition s;
    s.name        = Json::GetString(o, "name", "");
    s.description = Json::GetString(o, "description", "");
    s.enabled     = Json::GetBool(o, "enabled", false);
    s.networks    = Dedup(Json::GetStrings(o, "networks", {}));
    s.priority    = static_cast<int>(Json::GetInt(o, "priority", 0));
    s.domains     = Json::GetStrings(o, "domains", {});
    return s;
}

boost::json::value ServiceToJson(const ServiceDefinition &svc)
{
    boost::json::object o;
    o["name"]        = svc.name;
    o["enabled"]     = svc.enabled;
    o["networks"]    = Json::FromStrings(svc.networks);
    if (!svc.domains.empty())
    {
        o["domains"] = Json::FromStrings(svc.domains);
    }
    o["priority"]    = svc.priority;
    o["description"] = svc.description;
    return o;
}

Config ConfigFromJson(const boost::json::value &jv)
{
    if (!jv.is_object())
    {
        throw ConfigError("configuration root must be a JSON object");
    }
    const auto &o = jv.get_object();

    Config c = DefaultConfig();
    try
    {
        c.gateway            = Json::GetString(o, "gateway", c.gateway);
        c.check_interval     = static_cast<int>(Json::GetInt(o, "check_interval", c.check_interval));
        c.log_dir            = Json::GetString(o, "log_dir", c.log_dir);
        c.state_dir          = Json::GetString(o, "state_dir", c.state_dir);
        c.auto_start         = Json::GetBool(o, "auto_start", c.auto_start);
        c.debug              = Json::GetBool(o, "debug", c.debug);
        c.verify_routes      = Json::GetBool(o, "verify_routes", c.verify_routes);
        c.physical_interface = Json::GetString(o, "physical_interface", c.physical_interface);
        c.tunnel_prefixes    = Json::GetStrings(o, "tunnel_prefixes", c.tunnel_prefixes);
        c.shutdown_grace     = static_cast<int>(Json::GetInt(o, "shutdown_grace", c.shutdown_grace));

        if (const auto *svcs = o.if_contains("services"); svcs != nullptr && !svcs->is_null())
        {
            if (!svcs->is_object())
            {
                throw ConfigError("field 'services' must be an object");
            }
            for (const auto &kv : svcs->get_object())
            {
                if (!kv.value().is_object())
                {
                    throw ConfigError("service '" + Json::ToString(kv.key()) + "' must be an object");
                }
                c.services[Json::ToString(kv.key())] = ServiceFromJson(kv.value().get_object());
            }
        }
    }
    catch (const ConfigError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw ConfigError(e.what());
    }
    return c;
}

boost::json::value ConfigToJson(const Config &cfg)
{
    boost::json::object o;
    o["gateway"]        = cfg.gateway;
    o["check_interval"] = cfg.check_interval;
    o["log_dir"]        = cfg.log_dir;
    o["state_dir"]      = cfg.state_dir;

    boost::json::object svcs;
    for (const auto &[key, svc] : cfg.services)
    {
        svcs[key] = ServiceToJson(svc);
    }
    o["services"]           = std::move(svcs);
    o["auto_start"]         = cfg.auto_start;
    o["debug"]              = cfg.debug;
    o["verify_routes"]      = cfg.verify_routes;
    o["physical_interface"] = cfg.physical_interface;
    o["tunnel_prefixes"]    = Json::FromStrings(cfg.tunnel_prefixes);
    o["shutdown_grace"]     = cfg.shutdown_grace;
    return o;
}

ConfigManager::ConfigManager(std::string config_path, std::string services_dir)
        : config_path_(std::move(config_path))
        , services_dir_(std::move(services_dir))
        , cfg_(DefaultConfig())
{
}

void ConfigManager::Load()
{
    Config c = DefaultConfig();

    std::optional<std::string> text;
    try
    {
        text = AtomicFile::Read(config_path_);
    }
    catch (const PersistenceError &e)
    {
        throw ConfigError(std::string("failed to read config file: ") + e.what());
    }

    if (text)
    {
        try
        {
            c = ConfigFromJson(Json::Parse(*text));
        }
        catch (const ConfigError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw ConfigError("failed to parse config file " + config_path_ + ": " + e.what());
        }
        LOGD("config") << "Loaded " << config_path_;
    }
    else
    {
        LOGI("config") << "No config at " << config_path_ << ", using defaults";
    }

    if (c.services.empty())
    {
        c.services = DefaultServices();
    }

    cfg_ = std::move(c);
    LoadServices_();
    ValidateConfig(cfg_);

    LOGI("config") << "Configuration ready: " << cfg_.services.size() << " service(s), "
                   << EnabledByPriority(cfg_.services).size() << " enabled";
}

void ConfigManager::LoadServices_()
{
    std::error_code ec;
    if (!fs::is_directory(services_dir_, ec)) return;

    std::vector<fs::path> files;
    for (fs::directory_iterator it(services_dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file() && it->path().extension() == ".json")
        {
            files.push_back(it->path());
        }
    }
    if (ec)
    {
        LOGW("config") << "Cannot list " << services_dir_ << ": " << ec.message();
    }
    std::sort(files.begin(), files.end());

    for (const auto &p : files)
    {
        const std::string key = p.stem().string();
        try
        {
            auto text = AtomicFile::Read(p.string());
            if (!text) continue;

            auto jv = Json::Parse(*text);
            if (!jv.is_object())
            {
                throw std::runtime_error("not a JSON object");
            }

            const auto &o = jv.get_object();
            // wrapped form: a single key whose value is the service object
            if (o.size() == 1 && o.begin()->value().is_object())
            {
                cfg_.services[key] = ServiceFromJson(o.begin()->value().get_object());
            }
            else
            {
                cfg_.services[key] = ServiceFromJson(o);
            }
            LOGD("config") << "Service file loaded: " << p.string();
        }
        catch (const std::exception &e)
        {
            LOGW("config") << "Failed to load service " << p.filename().string() << ": " << e.what();
        }
    }
}

void ConfigManager::Save() const
{
    try
    {
        AtomicFile::Write(config_path_, Json::Pretty(ConfigToJson(cfg_)));
    }
    catch (const PersistenceError &e)
    {
        throw ConfigError(std::string("failed to write config file: ") + e.what());
    }
}

void ConfigManager::Set(Config cfg)
{
    ValidateConfig(cfg);
    cfg_ = std::move(cfg);
}

void ConfigManager::SaveServiceFile_(const std::string &key, const ServiceDefinition &svc) const
{
    boost::json::object wrapper;
    wrapper[key] = ServiceToJson(svc);

    const std::string path = (fs::path(services_dir_) / (key + ".json")).string();
    try
    {
        AtomicFile::Write(path, Json::Pretty(wrapper));
    }
    catch (const PersistenceError &e)
    {
        throw ConfigError(std::string("failed to update service file: ") + e.what());
    }
}

void ConfigManager::SetEnabled_(const std::string &name, bool enabled)
{
    auto it = cfg_.services.find(name);
    if (it == cfg_.services.end())
    {
        throw ConfigError("service '" + name + "' not found");
    }
    it->second.enabled = enabled;
    SaveServiceFile_(name, it->second);
    LOGI("config") << "Service " << name << (enabled ? " enabled" : " disabled");
}

void ConfigManager::EnableService(const std::string &name)
{
    SetEnabled_(name, true);
}

void ConfigManager::DisableService(const std::string &name)
{
    SetEnabled_(name, false);
}

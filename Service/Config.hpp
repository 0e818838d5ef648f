#pragma once

// Config.hpp — daemon configuration and service catalog (Boost.JSON on disk).

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

struct ServiceDefinition
{
    std::string              name;
    std::string              description;
    bool                     enabled  = false;
    std::vector<std::string> networks;   // CIDR, first occurrence wins
    int                      priority = 0;
    std::vector<std::string> domains;    // informational only
};

struct Config
{
    std::string gateway        = "auto";  // "auto" or a fixed IPv4
    int         check_interval = 5;       // seconds
    std::string log_dir;
    std::string state_dir;
    std::map<std::string, ServiceDefinition> services;
    bool        auto_start     = true;
    bool        debug          = false;

    bool                     verify_routes      = false;
    std::string              physical_interface = "en0";
    std::vector<std::string> tunnel_prefixes    = { "utun", "ppp", "ipsec", "tun" };
    int                      shutdown_grace     = 30;  // seconds
};

namespace Paths
{
    // $HOME/.splitroute
    std::string BaseDir();
    std::string ConfigFile();
    std::string ServicesDir();
    std::string LogDir();
    std::string StateDir();
}

Config DefaultConfig();

// Built-in catalog, used when the configuration defines no service at all.
std::map<std::string, ServiceDefinition> DefaultServices();

// Throw ConfigError describing the first problem found.
void ValidateService(const std::string &key, const ServiceDefinition &svc);
void ValidateConfig(const Config &cfg);

// Enabled services, highest priority first, ties by key.
std::vector<std::pair<std::string, ServiceDefinition>>
EnabledByPriority(const std::map<std::string, ServiceDefinition> &services);

ServiceDefinition  ServiceFromJson(const boost::json::object &o);
boost::json::value ServiceToJson(const ServiceDefinition &svc);
Config             ConfigFromJson(const boost::json::value &jv);
boost::json::value ConfigToJson(const Config &cfg);

/**
 * @brief Loads and saves config.json plus the per-service files in services/.
 *
 * Load order: defaults, then config.json (missing file is fine), then the built-in
 * catalog if config.json lists no service, then every services/<key>.json on top.
 * Service files may be `{ "<key>": {...} }` or a bare service object.
 */
class ConfigManager
{
public:
    ConfigManager(std::string config_path, std::string services_dir);

    // Throws ConfigError on unreadable/invalid config.json or failed validation.
    void Load();

    // Writes config.json atomically. Throws ConfigError.
    void Save() const;

    const Config &Get() const { return cfg_; }

    // Validates, then replaces the in-memory config.
    void Set(Config cfg);

    // Flip `enabled` and rewrite services/<name>.json. Unknown name -> ConfigError.
    void EnableService(const std::string &name);
    void DisableService(const std::string &name);

    const std::string &Path() const { return config_path_; }

private:
    void LoadServices_();
    void SaveServiceFile_(const std::string &key, const ServiceDefinition &svc) const;
    void SetEnabled_(const std::string &name, bool enabled);

private:
    std::string config_path_;
    std::string services_dir_;
    Config      cfg_;
};

// Main.cpp — splitroute: daemon entry point and the small management CLI around it.

#include "Core/Cidr.hpp"
#include "Core/Command.hpp"
#include "Core/Errors.hpp"
#include "Core/Json.hpp"
#include "Core/Logger.hpp"
#include "Network/ConnectivityDetector.hpp"
#include "Network/GatewayResolver.hpp"
#include "Network/Parsers.hpp"
#include "Network/RouteTable.hpp"
#include "Service/Config.hpp"
#include "Service/ReconciliationLoop.hpp"
#include "Service/StateStore.hpp"

#ifdef __linux__
#include "Network/Linux/NetWatcher.hpp"
#endif

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/core.hpp>

namespace
{
    struct CliArgs
    {
        std::string              config_path;
        bool                     debug = false;
        bool                     yes   = false;
        std::string              gateway;
        std::vector<std::string> words;
    };

    void PrintUsage(const char *argv0)
    {
        std::cout
                << "Usage: " << argv0 << " [--config <path>] [--debug] <command>\n"
                << "\n"
                << "Commands:\n"
                << "  run                              run the daemon (root)\n"
                << "  status                           daemon, VPN and route status\n"
                << "  routes list                      bypass routes present in the OS table\n"
                << "  routes add <cidr> [--gateway ip] add a bypass route (root)\n"
                << "  routes remove <cidr>             remove a bypass route (root)\n"
                << "  routes clear [-y]                remove every configured bypass route (root)\n"
                << "  routes test                      check gateway/VPN detection and routes\n"
                << "  services list                    show the service catalog\n"
                << "  services enable <name>           enable a service\n"
                << "  services disable <name>          disable a service\n"
                << "  config show                      print the effective configuration\n"
                << "  config validate                  validate the configuration\n";
    }

    CliArgs ParseArgs(int argc, char **argv)
    {
        CliArgs a;
        a.config_path = Paths::ConfigFile();
        for (int i = 1; i < argc; ++i)
        {
            std::string s = argv[i];
            if (s == "--config" && i + 1 < argc)       { a.config_path = argv[++i]; }
            else if (s == "--gateway" && i + 1 < argc) { a.gateway     = argv[++i]; }
            else if (s == "--debug")                   { a.debug       = true; }
            else if (s == "-y" || s == "--yes")        { a.yes         = true; }
            else                                       { a.words.push_back(s); }
        }
        return a;
    }

    bool IsElevated()
    {
        return ::geteuid() == 0;
    }

    bool RequireRoot()
    {
        if (IsElevated()) return true;
        std::cerr << "This command modifies the routing table; run it as root.\n";
        return false;
    }

    InterfacePolicy PolicyOf(const Config &cfg)
    {
        InterfacePolicy p;
        p.physical_interface = cfg.physical_interface;
        p.tunnel_prefixes    = cfg.tunnel_prefixes;
        return p;
    }

    std::string FormatDuration(std::chrono::seconds s)
    {
        const long long total = s.count();
        std::ostringstream os;
        if (total >= 3600) os << total / 3600 << "h";
        if (total >= 60)   os << (total % 3600) / 60 << "m";
        os << total % 60 << "s";
        return os.str();
    }

    // Configured networks that the OS currently routes outside the tunnel.
    std::vector<Route> ObservedBypassRoutes(const Config &cfg, bool enabled_only)
    {
        std::vector<Route> out;
        auto r = RunCommand({ "netstat", "-rn" });
        if (!r.Ok())
        {
            LOGW("main") << "netstat -rn failed rc=" << r.exit_code;
            return out;
        }

        const auto rows   = Parsers::ParseNetstat(r.out);
        const auto policy = PolicyOf(cfg);

        std::set<std::string> seen;
        for (const auto &[key, svc] : cfg.services)
        {
            if (enabled_only && !svc.enabled) continue;
            for (const auto &net : svc.networks)
            {
                if (seen.count(net) != 0) continue;
                const std::string shown = Cidr::NetstatForm(net);
                for (const auto &row : rows)
                {
                    if (row.ipv6 || row.destination != shown) continue;
                    if (policy.IsTunnel(row.iface) || !Cidr::IsIPv4(row.gateway)) continue;

                    Route route;
                    route.network = net;
                    route.gateway = row.gateway;
                    route.service = key;
                    out.push_back(route);
                    seen.insert(net);
                    break;
                }
            }
        }
        return out;
    }

    int CmdRun(ConfigManager &cm, const CliArgs &args, std::optional<Logger::Guard> &log)
    {
        if (!RequireRoot()) return 1;

        const Config cfg = cm.Get();

        Logger::Options lo;
        lo.directory            = cfg.log_dir;
        lo.file_min_severity    = (cfg.debug || args.debug) ? boost::log::trivial::debug : boost::log::trivial::info;
        lo.console_min_severity = lo.file_min_severity;
        log.reset();
        log.emplace(lo);

        LOGI("main") << "Starting SplitRoute daemon (config " << cm.Path() << ")";

        StateStore store(cfg.state_dir);
        if (store.IsDaemonRunning())
        {
            LOGE("main") << "Daemon already running (pid " << store.ReadPid().value_or(0) << ")";
            return 1;
        }
        try
        {
            store.WritePid(::getpid());
        }
        catch (const PersistenceError &e)
        {
            LOGE("main") << "Cannot write PID file: " << e.what();
            return 1;
        }

        const InterfacePolicy policy = PolicyOf(cfg);
        ConnectivityDetector  detector(RunCommand, policy);
        GatewayResolver       resolver(RunCommand, policy, cfg.gateway);
        RouteTable            routes(RunCommand);

        LoopOptions opts;
        opts.interval       = std::chrono::seconds(cfg.check_interval);
        opts.verify_routes  = cfg.verify_routes;
        opts.shutdown_grace = std::chrono::seconds(cfg.shutdown_grace);

        ReconciliationLoop loop(detector, resolver, routes, store, cfg.services, opts);
        loop.Start();

#ifdef __linux__
        NetWatcher watcher([&loop]() { loop.Kick(); });
        if (!watcher.IsRunning())
        {
            LOGW("main") << "Route change watcher unavailable, relying on the timer";
        }
#endif

        boost::asio::io_context   sig_io;
        boost::asio::signal_set   signals(sig_io, SIGINT, SIGTERM, SIGHUP);
        std::function<void(const boost::system::error_code &, int)> on_signal;
        on_signal = [&](const boost::system::error_code &ec, int sig)
        {
            if (ec) return;

            if (sig == SIGHUP)
            {
                LOGI("main") << "SIGHUP: reloading configuration";
                try
                {
                    cm.Load();
                    resolver.SetOverride(cm.Get().gateway);
                    loop.UpdateServices(cm.Get().services);
                }
                catch (const ConfigError &e)
                {
                    LOGE("main") << "Reload failed, keeping current configuration: " << e.what();
                }
                signals.async_wait(on_signal);
                return;
            }

            LOGI("main") << "Received signal " << sig << ", shutting down";
            sig_io.stop();
        };
        signals.async_wait(on_signal);
        sig_io.run();

#ifdef __linux__
        watcher.Stop();
#endif
        const bool clean = loop.Stop();

        try
        {
            store.RemovePid();
        }
        catch (const PersistenceError &e)
        {
            LOGW("main") << e.what();
        }

        if (!clean)
        {
            LOGE("main") << "Forced exit after shutdown grace period";
            boost::log::core::get()->flush();
            std::_Exit(2);
        }

        LOGI("main") << "SplitRoute stopped";
        return 0;
    }

    int CmdStatus(const Config &cfg)
    {
        StateStore store(cfg.state_dir);

        PersistedState st;
        try
        {
            st = store.Load();
        }
        catch (const PersistenceError &e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }

        const auto pid = store.ReadPid();

        ConnectivityDetector    detector(RunCommand, PolicyOf(cfg));
        ConnectivityObservation obs;
        try
        {
            obs = detector.Observe();
        }
        catch (const DetectionError &e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }

        LoopStatus s;
        s.running       = store.IsDaemonRunning();
        s.vpn_connected = st.vpn_connected;
        s.routes_active = st.routes_active;
        s.gateway       = st.last_gateway;
        s.last_check    = st.last_check;
        s.tunnel_iface  = obs.tunnel_iface;
        s.active_routes = ObservedBypassRoutes(cfg, true);
        for (const auto &[key, svc] : cfg.services)
        {
            if (!svc.enabled) continue;
            auto it = st.active_services.find(key);
            s.enabled_services[key] = it != st.active_services.end() && it->second;
        }
        if (s.running && st.start_time.time_since_epoch().count() != 0)
        {
            s.uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - st.start_time);
        }

        std::cout << "Status:   " << s.Summary() << "\n";
        std::cout << "Daemon:   " << (s.running ? "running (pid " + std::to_string(*pid) + ")" : std::string("not running")) << "\n";
        std::cout << "VPN now:  " << (obs.connected ? "connected" : "disconnected");
        if (!obs.tunnel_iface.empty())
        {
            std::cout << " via " << obs.tunnel_iface;
            const std::string tgw = detector.TunnelGateway();
            if (!tgw.empty()) std::cout << " (gateway " << tgw << ")";
        }
        std::cout << "\n";
        std::cout << "Gateway:  " << (s.gateway.empty() ? "-" : s.gateway) << "\n";
        if (st.last_check.time_since_epoch().count() != 0)
        {
            std::cout << "Checked:  " << Timestamps::Format(st.last_check) << "\n";
        }
        if (s.running)
        {
            std::cout << "Uptime:   " << FormatDuration(s.uptime) << "\n";
        }

        std::cout << "\nServices:\n";
        for (const auto &[key, svc] : EnabledByPriority(cfg.services))
        {
            std::size_t n = 0;
            for (const auto &r : s.active_routes)
            {
                if (r.service == key) ++n;
            }
            std::cout << "  " << std::left << std::setw(16) << key
                      << (s.enabled_services[key] ? "active  " : "inactive")
                      << "  " << n << "/" << svc.networks.size() << " routes\n";
        }
        std::cout << "\nBypass routes in OS table: " << s.active_routes.size() << "\n";
        return 0;
    }

    int CmdRoutes(const Config &cfg, const CliArgs &args)
    {
        const std::string sub = args.words.size() > 1 ? args.words[1] : "list";
        const InterfacePolicy policy = PolicyOf(cfg);

        if (sub == "list")
        {
            const auto routes = ObservedBypassRoutes(cfg, false);
            if (routes.empty())
            {
                std::cout << "No active routes\n";
                return 0;
            }
            std::cout << std::left << std::setw(20) << "NETWORK" << std::setw(16) << "GATEWAY" << "SERVICE\n";
            for (const auto &r : routes)
            {
                std::cout << std::left << std::setw(20) << r.network << std::setw(16) << r.gateway << r.service << "\n";
            }
            std::cout << "\nTotal: " << routes.size() << " routes\n";
            return 0;
        }

        if (sub == "add" || sub == "remove")
        {
            if (args.words.size() < 3)
            {
                std::cerr << "Usage: routes " << sub << " <cidr>\n";
                return 1;
            }
            if (!RequireRoot()) return 1;

            const std::string net = args.words[2];
            RouteTable        table(RunCommand);
            try
            {
                if (sub == "remove")
                {
                    table.Remove(net);
                    std::cout << "Route removed: " << net << "\n";
                    return 0;
                }

                std::string gw = args.gateway.empty() ? cfg.gateway : args.gateway;
                if (gw.empty() || gw == "auto")
                {
                    GatewayResolver resolver(RunCommand, policy);
                    const auto      res = resolver.Resolve();
                    if (!res.detected)
                    {
                        std::cerr << "Failed to detect gateway: " << res.error << "\n";
                        return 1;
                    }
                    gw = res.address;
                    std::cout << "Using detected gateway: " << gw << "\n";
                }
                table.Add(net, gw, "manual");
                std::cout << "Route added: " << net << " -> " << gw << "\n";
                return 0;
            }
            catch (const RouteError &e)
            {
                std::cerr << e.what() << "\n";
                return 1;
            }
        }

        if (sub == "clear")
        {
            if (!RequireRoot()) return 1;

            const auto routes = ObservedBypassRoutes(cfg, false);
            if (routes.empty())
            {
                std::cout << "No routes to remove\n";
                return 0;
            }
            if (!args.yes)
            {
                std::cout << "Remove " << routes.size() << " routes? [y/N]: " << std::flush;
                std::string answer;
                std::getline(std::cin, answer);
                if (answer != "y" && answer != "Y")
                {
                    std::cout << "Cancelled\n";
                    return 0;
                }
            }

            RouteTable  table(RunCommand);
            std::size_t removed = 0;
            for (const auto &r : routes)
            {
                try
                {
                    table.Remove(r.network);
                    ++removed;
                }
                catch (const RouteError &e)
                {
                    std::cerr << e.what() << "\n";
                }
            }
            std::cout << "Removed " << removed << "/" << routes.size() << " routes\n";
            return removed == routes.size() ? 0 : 1;
        }

        if (sub == "test")
        {
            GatewayResolver resolver(RunCommand, policy, cfg.gateway);
            const auto      gw = resolver.Resolve();
            std::cout << "Gateway detection: ";
            if (gw.detected) std::cout << gw.address << " (" << gw.method << ")\n";
            else             std::cout << "failed: " << gw.error << " (fallback " << gw.address << ")\n";

            ConnectivityDetector detector(RunCommand, policy);
            std::cout << "VPN detection:     ";
            try
            {
                const auto obs = detector.Observe();
                std::cout << (obs.connected ? "connected" : "not connected");
                if (!obs.tunnel_iface.empty()) std::cout << " via " << obs.tunnel_iface;
            }
            catch (const DetectionError &e)
            {
                std::cout << "unknown (" << e.what() << ")";
            }
            std::cout << "\n";

            std::size_t wanted = 0;
            for (const auto &[key, svc] : EnabledByPriority(cfg.services)) wanted += svc.networks.size();
            const auto present = ObservedBypassRoutes(cfg, true);
            std::cout << "Verification:      " << present.size() << "/" << wanted
                      << " enabled networks routed outside the tunnel\n";
            return 0;
        }

        std::cerr << "Unknown routes command: " << sub << "\n";
        return 1;
    }

    void NotifyDaemon(const Config &cfg)
    {
        StateStore store(cfg.state_dir);
        auto       pid = store.ReadPid();
        if (!pid || !store.IsDaemonRunning())
        {
            std::cout << "Daemon not running; change applies on next start\n";
            return;
        }
        if (::kill(*pid, SIGHUP) == 0)
        {
            std::cout << "Daemon notified (pid " << *pid << ")\n";
        }
        else
        {
            std::cerr << "Could not signal daemon pid " << *pid << "; restart it to apply\n";
        }
    }

    int CmdServices(ConfigManager &cm, const CliArgs &args)
    {
        const std::string sub = args.words.size() > 1 ? args.words[1] : "list";

        if (sub == "list")
        {
            std::vector<std::pair<std::string, ServiceDefinition>> all(cm.Get().services.begin(),
                                                                       cm.Get().services.end());
            std::stable_sort(all.begin(), all.end(), [](const auto &a, const auto &b)
            {
                return a.second.priority > b.second.priority;
            });

            std::cout << std::left << std::setw(16) << "KEY" << std::setw(16) << "NAME"
                      << std::setw(9) << "ENABLED" << std::setw(10) << "PRIORITY" << "NETWORKS\n";
            for (const auto &[key, svc] : all)
            {
                std::cout << std::left << std::setw(16) << key << std::setw(16) << svc.name
                          << std::setw(9) << (svc.enabled ? "yes" : "no")
                          << std::setw(10) << svc.priority << svc.networks.size() << "\n";
            }
            return 0;
        }

        if (sub == "enable" || sub == "disable")
        {
            if (args.words.size() < 3)
            {
                std::cerr << "Usage: services " << sub << " <name>\n";
                return 1;
            }
            const std::string name = args.words[2];
            try
            {
                if (sub == "enable") cm.EnableService(name);
                else                 cm.DisableService(name);
                cm.Save();
            }
            catch (const ConfigError &e)
            {
                std::cerr << e.what() << "\n";
                return 1;
            }
            std::cout << "Service " << name << (sub == "enable" ? " enabled" : " disabled") << "\n";
            NotifyDaemon(cm.Get());
            return 0;
        }

        std::cerr << "Unknown services command: " << sub << "\n";
        return 1;
    }

    int CmdConfig(const ConfigManager &cm, const CliArgs &args)
    {
        const std::string sub = args.words.size() > 1 ? args.words[1] : "show";
        if (sub == "show")
        {
            std::cout << Json::Pretty(ConfigToJson(cm.Get()));
            return 0;
        }
        if (sub == "validate")
        {
            // Load() already validated
            std::cout << "Configuration is valid (" << cm.Get().services.size() << " services)\n";
            return 0;
        }
        std::cerr << "Unknown config command: " << sub << "\n";
        return 1;
    }
}

int main(int argc, char **argv)
{
    const CliArgs args = ParseArgs(argc, argv);
    if (args.words.empty() || args.words[0] == "help" || args.words[0] == "-h" || args.words[0] == "--help")
    {
        PrintUsage(argv[0]);
        return args.words.empty() ? 1 : 0;
    }

    // CLI commands log to the console only; `run` replaces this with the daemon sinks
    Logger::Options lo;
    lo.to_file              = false;
    lo.console_min_severity = args.debug ? boost::log::trivial::debug : boost::log::trivial::warning;
    std::optional<Logger::Guard> log;
    log.emplace(lo);

    const std::string services_dir =
            (std::filesystem::path(args.config_path).parent_path() / "services").string();
    ConfigManager cm(args.config_path, services_dir);
    try
    {
        cm.Load();
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    const std::string &cmd = args.words[0];
    try
    {
        if (cmd == "run")      return CmdRun(cm, args, log);
        if (cmd == "status")   return CmdStatus(cm.Get());
        if (cmd == "routes" || cmd == "route") return CmdRoutes(cm.Get(), args);
        if (cmd == "services" || cmd == "service") return CmdServices(cm, args);
        if (cmd == "config")   return CmdConfig(cm, args);
    }
    catch (const std::exception &e)
    {
        LOGE("main") << "Fatal: " << e.what();
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    PrintUsage(argv[0]);
    return 1;
}

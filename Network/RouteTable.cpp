#include "Network/RouteTable.hpp"
#include "Core/Cidr.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <sstream>

namespace
{
    bool Mentions(const CommandResult &r, const char *needle)
    {
        return r.out.find(needle) != std::string::npos || r.err.find(needle) != std::string::npos;
    }

    std::string OneLine(std::string s)
    {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
        for (auto &c : s)
        {
            if (c == '\n') c = ' ';
        }
        return s;
    }

    std::string Describe(const CommandResult &r)
    {
        std::ostringstream os;
        os << "rc=" << r.exit_code;
        const std::string text = OneLine(r.Combined());
        if (!text.empty()) os << ": " << text;
        return os.str();
    }

    [[noreturn]] void ThrowAggregated(const std::string &what,
                                      const std::vector<std::string> &failed,
                                      const std::vector<std::string> &details)
    {
        std::ostringstream os;
        os << what << ": ";
        for (std::size_t i = 0; i < details.size(); ++i)
        {
            if (i) os << "; ";
            os << details[i];
        }
        throw RouteError(os.str(), failed);
    }

    bool ByService(const Route &r, const std::string &svc) { return r.service == svc; }
    bool Any(const Route &, const std::string &)            { return true; }
}

RouteTable::RouteTable(CommandRunner run)
        : run_(std::move(run))
{
}

CommandResult RouteTable::AddCommand_(const std::string &network, const std::string &gateway)
{
    return run_({ "route", "-n", "add", "-net", network, gateway });
}

RouteTable::DeleteResult RouteTable::DeleteCommand_(const std::string &network, std::string &detail)
{
    auto r = run_({ "route", "-n", "delete", "-net", network });
    if (r.Ok()) return DeleteResult::Removed;

    if (Mentions(r, "not in table") || Mentions(r, "No such process"))
    {
        LOGD("routes") << "Delete " << network << ": already absent";
        return DeleteResult::Absent;
    }

    detail = Describe(r);
    return DeleteResult::Failed;
}

CommandResult RouteTable::InstallWithAdoption_(const std::string &network, const std::string &gateway)
{
    auto r = AddCommand_(network, gateway);
    if (r.Ok() || !Mentions(r, "File exists")) return r;

    // Someone (usually our previous incarnation) left a route behind; replace it once.
    LOGI("routes") << "Adopting existing OS route for " << network;
    std::string detail;
    if (DeleteCommand_(network, detail) == DeleteResult::Failed)
    {
        LOGW("routes") << "Could not replace existing route " << network << ": " << detail;
        return r;
    }
    return AddCommand_(network, gateway);
}

void RouteTable::Add(const std::string &network, const std::string &gateway, const std::string &service)
{
    std::lock_guard<std::mutex> lk(mu_);

    if (!Cidr::Parse(network))
    {
        throw RouteError("invalid network format " + network, network);
    }
    if (!Cidr::IsIPv4(gateway))
    {
        throw RouteError("invalid gateway " + gateway + " for " + network, network);
    }

    auto it = routes_.find(network);
    if (it != routes_.end())
    {
        if (it->second.gateway == gateway)
        {
            LOGD("routes") << "Route for " << network << " already exists via " << gateway;
            return;
        }

        std::string detail;
        if (DeleteCommand_(network, detail) == DeleteResult::Failed)
        {
            LOGE("routes") << "Failed to remove stale route " << network
                           << " via " << it->second.gateway << ": " << detail;
        }
        routes_.erase(it);
    }

    auto r = InstallWithAdoption_(network, gateway);
    if (!r.Ok())
    {
        throw RouteError("failed to add route " + network + " via " + gateway + ": " + Describe(r), network);
    }

    Route route;
    route.network      = network;
    route.gateway      = gateway;
    route.service      = service;
    route.installed_at = std::chrono::system_clock::now();
    routes_.emplace(network, std::move(route));

    LOGI("routes") << "Added route: " << network << " -> " << gateway << " (service: " << service << ")";
}

void RouteTable::Remove(const std::string &network)
{
    std::lock_guard<std::mutex> lk(mu_);

    if (!Cidr::Parse(network))
    {
        throw RouteError("invalid network format " + network, network);
    }

    std::string detail;
    if (DeleteCommand_(network, detail) == DeleteResult::Failed)
    {
        throw RouteError("failed to remove route " + network + ": " + detail, network);
    }

    auto it = routes_.find(network);
    if (it != routes_.end())
    {
        LOGI("routes") << "Removed route: " << network << " (service: " << it->second.service << ")";
        routes_.erase(it);
    }
    else
    {
        LOGI("routes") << "Removed untracked route: " << network;
    }
}

void RouteTable::RemoveWhere_(const std::string &what,
                              bool (*match)(const Route &, const std::string &),
                              const std::string &arg)
{
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<std::string> failed;
    std::vector<std::string> details;
    std::size_t              removed = 0;

    for (auto it = routes_.begin(); it != routes_.end();)
    {
        if (!match(it->second, arg))
        {
            ++it;
            continue;
        }

        std::string detail;
        if (DeleteCommand_(it->first, detail) == DeleteResult::Failed)
        {
            LOGE("routes") << "Failed to remove " << it->first << ": " << detail;
            failed.push_back(it->first);
            details.push_back(it->first + ": " + detail);
        }
        else
        {
            ++removed;
        }
        // forgotten either way; the OS leftover is reported through the error
        it = routes_.erase(it);
    }

    LOGI("routes") << what << ": removed " << removed << ", failed " << failed.size();

    if (!failed.empty())
    {
        ThrowAggregated("failed to remove some routes", failed, details);
    }
}

void RouteTable::RemoveAll()
{
    RemoveWhere_("Remove all", &Any, {});
}

void RouteTable::RemoveService(const std::string &service)
{
    RemoveWhere_("Remove service " + service, &ByService, service);
}

bool RouteTable::Snapshot_(std::vector<Parsers::RouteRow> &rows)
{
    auto r = run_({ "netstat", "-rn" });
    if (!r.Ok())
    {
        LOGW("routes") << "netstat -rn failed: " << Describe(r);
        return false;
    }
    rows = Parsers::ParseNetstat(r.out);
    return true;
}

bool RouteTable::Present_(const std::vector<Parsers::RouteRow> &rows, const Route &r) const
{
    const std::string shown = Cidr::NetstatForm(r.network);
    for (const auto &row : rows)
    {
        if (row.ipv6) continue;
        if (row.destination == shown && row.gateway == r.gateway) return true;
    }
    LOGD("routes") << "Verification failed: network=" << r.network
                   << " netstat=" << shown << " gateway=" << r.gateway;
    return false;
}

bool RouteTable::Verify(const std::string &network)
{
    std::lock_guard<std::mutex> lk(mu_);

    auto it = routes_.find(network);
    if (it == routes_.end()) return false;

    std::vector<Parsers::RouteRow> rows;
    if (!Snapshot_(rows)) return false;
    return Present_(rows, it->second);
}

std::map<std::string, bool> RouteTable::VerifyAll()
{
    std::lock_guard<std::mutex> lk(mu_);

    std::map<std::string, bool> res;
    std::vector<Parsers::RouteRow> rows;
    const bool have = Snapshot_(rows);
    for (const auto &[net, route] : routes_)
    {
        res[net] = have && Present_(rows, route);
    }
    return res;
}

void RouteTable::Restore(const std::string &gateway, const std::vector<std::string> &networks)
{
    std::lock_guard<std::mutex> lk(mu_);

    if (!Cidr::IsIPv4(gateway))
    {
        throw RouteError("invalid gateway " + gateway, networks);
    }

    std::vector<std::string> targets = networks;
    if (targets.empty())
    {
        for (const auto &kv : routes_) targets.push_back(kv.first);
    }

    std::vector<std::string> failed;
    std::vector<std::string> details;
    for (const auto &net : targets)
    {
        auto it = routes_.find(net);
        if (it == routes_.end()) continue;

        auto r = InstallWithAdoption_(net, gateway);
        if (!r.Ok())
        {
            failed.push_back(net);
            details.push_back(net + ": " + Describe(r));
            continue;
        }
        it->second.gateway      = gateway;
        it->second.installed_at = std::chrono::system_clock::now();
        LOGI("routes") << "Restored route: " << net << " -> " << gateway;
    }

    if (!failed.empty())
    {
        ThrowAggregated("failed to restore some routes", failed, details);
    }
}

std::size_t RouteTable::PurgeStale(const std::vector<std::string> &networks, const std::string &gateway)
{
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<Parsers::RouteRow> rows;
    if (!Snapshot_(rows)) return 0;

    std::size_t purged = 0;
    for (const auto &net : networks)
    {
        if (routes_.count(net) != 0 || !Cidr::Parse(net)) continue;

        bool present = false;
        const std::string shown = Cidr::NetstatForm(net);
        for (const auto &row : rows)
        {
            if (!row.ipv6 && row.destination == shown && row.gateway == gateway)
            {
                present = true;
                break;
            }
        }
        if (!present) continue;

        std::string detail;
        if (DeleteCommand_(net, detail) == DeleteResult::Failed)
        {
            LOGW("routes") << "Stale route " << net << " could not be removed: " << detail;
            continue;
        }
        ++purged;
    }

    if (purged != 0)
    {
        LOGI("routes") << "Purged " << purged << " stale route(s) via " << gateway;
    }
    return purged;
}

std::vector<Route> RouteTable::ActiveRoutes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Route> out;
    out.reserve(routes_.size());
    for (const auto &kv : routes_) out.push_back(kv.second);
    return out;
}

std::size_t RouteTable::Count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return routes_.size();
}

std::size_t RouteTable::CountForService(const std::string &service) const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto &kv : routes_)
    {
        if (kv.second.service == service) ++n;
    }
    return n;
}

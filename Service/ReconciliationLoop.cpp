#include "Service/ReconciliationLoop.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

#include <future>
#include <memory>
#include <sstream>

#include <boost/asio/post.hpp>

std::string LoopStatus::Summary() const
{
    if (!running)       return "Service not running";
    if (!vpn_connected) return "VPN disconnected";
    if (!routes_active) return "VPN connected, routes pending";

    std::size_t active = 0;
    for (const auto &kv : enabled_services)
    {
        if (kv.second) ++active;
    }

    std::ostringstream os;
    os << "VPN connected, " << active << " services active, " << active_routes.size() << " routes";
    return os.str();
}

ReconciliationLoop::ReconciliationLoop(ConnectivityDetector &detector,
                                       GatewayResolver &resolver,
                                       RouteTable &routes,
                                       StateStore &store,
                                       std::map<std::string, ServiceDefinition> services,
                                       LoopOptions opts)
        : detector_(detector)
        , resolver_(resolver)
        , routes_(routes)
        , store_(store)
        , opts_(opts)
        , services_(std::move(services))
        , timer_(io_)
{
    state_.start_time = Timestamps::NowMs();
}

ReconciliationLoop::~ReconciliationLoop()
{
    if (running_)
    {
        (void)Stop();
    }
}

void ReconciliationLoop::LoadState()
{
    PersistedState loaded;
    try
    {
        loaded = store_.Load();
    }
    catch (const PersistenceError &e)
    {
        LOGW("state") << "Ignoring unreadable state: " << e.what();
        return;
    }

    std::lock_guard<std::mutex> lk(mu_);
    prior_routes_active_ = loaded.routes_active;
    prior_gateway_       = loaded.last_gateway;

    const TimePoint started = state_.start_time;
    state_            = loaded;
    state_.start_time = started;

    LOGI("state") << "Loaded state: vpn=" << loaded.vpn_connected
                  << " routes_active=" << loaded.routes_active
                  << " gateway=" << (loaded.last_gateway.empty() ? "-" : loaded.last_gateway);
}

void ReconciliationLoop::Start()
{
    if (running_.exchange(true))
    {
        return;
    }
    stopping_ = false;

    LoadState();

    io_.restart();
    work_.emplace(boost::asio::make_work_guard(io_));
    thread_ = std::jthread([this]()
                           {
                               LOGD("loop") << "Worker started";
                               io_.run();
                               LOGD("loop") << "Worker exiting";
                           });

    LOGI("loop") << "Monitoring started (interval " << opts_.interval.count() << "s"
                 << (opts_.verify_routes ? ", verify on" : "") << ")";

    // first poll right away, then the periodic ticker
    boost::asio::post(io_, [this]()
    {
        RunStep_();
        ScheduleNext_();
    });
}

void ReconciliationLoop::ScheduleNext_()
{
    if (stopping_) return;

    timer_.expires_after(opts_.interval);
    timer_.async_wait([this](const boost::system::error_code &ec)
                      {
                          if (ec == boost::asio::error::operation_aborted || stopping_) return;
                          RunStep_();
                          ScheduleNext_();
                      });
}

void ReconciliationLoop::RunStep_()
{
    try
    {
        ReconcileOnce();
    }
    catch (const std::exception &e)
    {
        LOGE("loop") << "Reconciliation step failed: " << e.what();
    }
}

void ReconciliationLoop::Kick()
{
    if (!running_ || stopping_) return;
    boost::asio::post(io_, [this]() { RunStep_(); });
}

bool ReconciliationLoop::Stop()
{
    if (!running_.exchange(false))
    {
        return true;
    }
    stopping_ = true;

    LOGI("loop") << "Stopping (grace " << opts_.shutdown_grace.count() << "s)";

    auto done = std::make_shared<std::promise<void>>();
    auto fut  = done->get_future();
    boost::asio::post(io_, [this, done]()
    {
        Shutdown_();
        done->set_value();
    });

    const bool finished = fut.wait_for(opts_.shutdown_grace) == std::future_status::ready;

    work_.reset();
    io_.stop();

    if (finished)
    {
        if (thread_.joinable()) thread_.join();
        LOGI("loop") << "Stopped gracefully";
    }
    else
    {
        LOGE("loop") << "Shutdown did not finish within " << opts_.shutdown_grace.count()
                     << "s, some routes may remain";
        if (thread_.joinable()) thread_.detach();
    }
    return finished;
}

void ReconciliationLoop::Shutdown_()
{
    timer_.cancel();

    std::lock_guard<std::mutex> step(step_mu_);
    try
    {
        routes_.RemoveAll();
    }
    catch (const RouteError &e)
    {
        LOGE("loop") << "Failed to remove routes during shutdown: " << e.what();
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &kv : state_.active_services) kv.second = false;
    }
    Persist_();
}

void ReconciliationLoop::ReconcileOnce()
{
    if (stopping_) return;

    std::lock_guard<std::mutex> step(step_mu_);

    ConnectivityObservation obs;
    try
    {
        obs = detector_.Observe();
    }
    catch (const DetectionError &e)
    {
        // unknown is not "disconnected": keep routes and state, retry next tick
        LOGW("loop") << "VPN state unknown: " << e.what() << "; will retry";
        std::lock_guard<std::mutex> lk(mu_);
        state_.last_check = Timestamps::NowMs();
        return;
    }

    bool was_connected = false;
    bool first         = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_.last_check = Timestamps::NowMs();
        tunnel_iface_     = obs.tunnel_iface;
        was_connected     = connected_;
        first             = first_poll_;
        first_poll_       = false;
    }

    LOGD("loop") << "Monitoring: vpn=" << obs.connected << " routes=" << routes_.Count();

    if (obs.connected == was_connected)
    {
        if (first)
        {
            // still disconnected after a restart: whatever the old snapshot claims is stale
            PurgeLeftovers_();
            Persist_();
        }
        else if (obs.connected && opts_.verify_routes)
        {
            VerifyAndRestore_();
        }
        return;
    }

    LOGI("loop") << "VPN state changed: connected=" << obs.connected
                 << (obs.tunnel_iface.empty() ? "" : " via " + obs.tunnel_iface);

    if (obs.connected)
    {
        if (!OnConnected_())
        {
            // stay Disconnected; the next tick retries the transition
            return;
        }
    }
    else
    {
        OnDisconnected_();
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        connected_            = obs.connected;
        state_.vpn_connected  = obs.connected;
        restore_failed_       = false;
    }
    Persist_();

    LOGI("loop") << Status().Summary();
}

bool ReconciliationLoop::ApplyService_(const std::string &key,
                                       const ServiceDefinition &svc,
                                       const std::string &gateway)
{
    std::size_t failed = 0;
    for (const auto &net : svc.networks)
    {
        try
        {
            routes_.Add(net, gateway, key);
        }
        catch (const RouteError &e)
        {
            ++failed;
            LOGE("loop") << "Service " << key << ": " << e.what();
        }
    }

    if (failed == 0)
    {
        LOGI("loop") << "Added " << svc.networks.size() << " routes for " << key;
    }
    else
    {
        LOGW("loop") << "Service " << key << ": " << failed << "/" << svc.networks.size() << " routes failed";
    }
    return failed == 0;
}

bool ReconciliationLoop::OnConnected_()
{
    LOGI("loop") << "VPN connected - adding bypass routes";

    const GatewayResolution gw = resolver_.Resolve();
    if (!gw.detected)
    {
        LOGE("loop") << "Failed to detect gateway: " << gw.error << "; will retry";
        return false;
    }

    std::map<std::string, ServiceDefinition> services;
    {
        std::lock_guard<std::mutex> lk(mu_);
        services           = services_;
        state_.last_gateway = gw.address;
    }

    const auto enabled = EnabledByPriority(services);
    if (enabled.empty())
    {
        LOGW("loop") << "No services enabled for bypass";
    }

    std::map<std::string, bool> active;
    for (const auto &[key, svc] : enabled)
    {
        active[key] = ApplyService_(key, svc, gw.address);
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &[key, ok] : active) state_.active_services[key] = ok;
    }

    LOGI("loop") << "Bypass via " << gw.address << " (" << gw.method << "): " << routes_.Count() << " routes";
    return true;
}

void ReconciliationLoop::OnDisconnected_()
{
    LOGI("loop") << "VPN disconnected - removing bypass routes";

    try
    {
        routes_.RemoveAll();
    }
    catch (const RouteError &e)
    {
        LOGE("loop") << "Failed to remove routes: " << e.what();
    }

    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : state_.active_services) kv.second = false;
}

void ReconciliationLoop::PurgeLeftovers_()
{
    bool        claimed = false;
    std::string gateway;
    std::vector<std::string> networks;
    {
        std::lock_guard<std::mutex> lk(mu_);
        claimed = prior_routes_active_;
        gateway = prior_gateway_;
        for (const auto &[key, svc] : EnabledByPriority(services_))
        {
            networks.insert(networks.end(), svc.networks.begin(), svc.networks.end());
        }

        state_.vpn_connected = false;
        for (auto &kv : state_.active_services) kv.second = false;
        prior_routes_active_ = false;
    }

    if (!claimed || gateway.empty()) return;

    LOGI("loop") << "Previous run left routes active via " << gateway << ", cleaning up";
    routes_.PurgeStale(networks, gateway);
}

void ReconciliationLoop::VerifyAndRestore_()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (restore_failed_) return;
    }

    std::vector<std::string> missing;
    for (const auto &[net, ok] : routes_.VerifyAll())
    {
        if (!ok)
        {
            LOGW("loop") << "Route verification failed for " << net;
            missing.push_back(net);
        }
    }
    if (missing.empty()) return;

    LOGW("loop") << missing.size() << " routes failed verification - attempting to restore";

    resolver_.Invalidate();
    const GatewayResolution gw = resolver_.Resolve();
    if (!gw.detected)
    {
        LOGE("loop") << "Failed to detect gateway for route restoration: " << gw.error;
        std::lock_guard<std::mutex> lk(mu_);
        restore_failed_ = true;
        return;
    }

    bool ok = true;
    try
    {
        routes_.Restore(gw.address, missing);
        LOGI("loop") << "Restored " << missing.size() << " routes via " << gw.address;
    }
    catch (const RouteError &e)
    {
        ok = false;
        LOGE("loop") << "Route restoration failed: " << e.what();
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        state_.last_gateway = gw.address;
        restore_failed_     = !ok;
    }
    Persist_();
}

void ReconciliationLoop::UpdateServices(std::map<std::string, ServiceDefinition> services)
{
    std::lock_guard<std::mutex> step(step_mu_);

    std::map<std::string, ServiceDefinition> old;
    bool connected = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        old       = std::move(services_);
        services_ = services;
        connected = connected_;
    }

    for (const auto &[key, svc] : old)
    {
        if (!svc.enabled) continue;

        auto it = services.find(key);
        const bool still = it != services.end() && it->second.enabled && it->second.networks == svc.networks;
        if (still) continue;

        try
        {
            routes_.RemoveService(key);
        }
        catch (const RouteError &e)
        {
            LOGE("loop") << "Failed to remove routes for " << key << ": " << e.what();
        }

        std::lock_guard<std::mutex> lk(mu_);
        if (it == services.end()) state_.active_services.erase(key);
        else                      state_.active_services[key] = false;
        LOGI("loop") << "Service " << key << " routes removed";
    }

    if (connected)
    {
        const GatewayResolution gw = resolver_.Resolve();
        if (!gw.detected)
        {
            LOGE("loop") << "Failed to detect gateway: " << gw.error << "; new services wait for the next transition";
        }
        else
        {
            // re-applying is idempotent; it also restores networks shared with a removed service
            for (const auto &[key, svc] : EnabledByPriority(services))
            {
                const bool ok = ApplyService_(key, svc, gw.address);
                std::lock_guard<std::mutex> lk(mu_);
                state_.active_services[key] = ok;
                state_.last_gateway         = gw.address;
            }
        }
    }

    Persist_();
    LOGI("loop") << "Service catalog updated: " << EnabledByPriority(services).size() << " enabled";
}

void ReconciliationLoop::Persist_()
{
    const bool active = routes_.Count() != 0;

    PersistedState snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_.routes_active = active;
        snapshot             = state_;
    }

    try
    {
        store_.Save(snapshot);
    }
    catch (const PersistenceError &e)
    {
        LOGE("state") << "Failed to save state: " << e.what();
    }
}

PersistedState ReconciliationLoop::State() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool ReconciliationLoop::IsConnected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_;
}

LoopStatus ReconciliationLoop::Status() const
{
    LoopStatus s;
    s.active_routes = routes_.ActiveRoutes();
    s.routes_active = !s.active_routes.empty();
    s.running       = running_;

    std::lock_guard<std::mutex> lk(mu_);
    s.vpn_connected = connected_;
    s.gateway       = state_.last_gateway;
    s.tunnel_iface  = tunnel_iface_;
    s.last_check    = state_.last_check;
    for (const auto &[key, svc] : services_)
    {
        if (!svc.enabled) continue;
        auto it = state_.active_services.find(key);
        s.enabled_services[key] = it != state_.active_services.end() && it->second;
    }

    const auto up = std::chrono::system_clock::now() - state_.start_time;
    s.uptime = std::chrono::duration_cast<std::chrono::seconds>(up);
    return s;
}

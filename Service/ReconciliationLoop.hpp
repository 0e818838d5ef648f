#pragma once

// ReconciliationLoop.hpp — polls connectivity and keeps the bypass routes in line with it.
//
// Disconnected --(tunnel seen, gateway resolved)--> Connected : add every enabled service's networks
// Connected    --(tunnel gone)-------------------> Disconnected : remove every route
//
// Runs on its own Boost.Asio io_context thread: one immediate poll, then a steady_timer tick.
// Collaborators are owned by the caller and must outlive the loop.

#include "Network/ConnectivityDetector.hpp"
#include "Network/GatewayResolver.hpp"
#include "Network/RouteTable.hpp"
#include "Service/Config.hpp"
#include "Service/StateStore.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

struct LoopOptions
{
    std::chrono::seconds interval{ 5 };
    bool                 verify_routes = false;
    std::chrono::seconds shutdown_grace{ 30 };
};

struct LoopStatus
{
    bool                        running       = false;
    bool                        vpn_connected = false;
    bool                        routes_active = false;
    std::vector<Route>          active_routes;
    std::map<std::string, bool> enabled_services;  // enabled service -> routes installed
    std::string                 gateway;
    std::string                 tunnel_iface;
    TimePoint                   last_check{};
    std::chrono::seconds        uptime{ 0 };

    // "VPN connected, 2 services active, 19 routes"
    std::string Summary() const;
};

class ReconciliationLoop
{
public:
    ReconciliationLoop(ConnectivityDetector &detector,
                       GatewayResolver &resolver,
                       RouteTable &routes,
                       StateStore &store,
                       std::map<std::string, ServiceDefinition> services,
                       LoopOptions opts);

    ~ReconciliationLoop();

    ReconciliationLoop(const ReconciliationLoop&)            = delete;
    ReconciliationLoop& operator=(const ReconciliationLoop&) = delete;

    // Loads the persisted snapshot (reporting only) and starts the worker thread.
    void Start();

    /**
     * @brief Cooperative shutdown.
     *
     * The step in progress completes, then all routes are removed and the state saved.
     * Returns false if that did not finish within shutdown_grace; the worker is then
     * detached and the caller is expected to terminate the process.
     */
    bool Stop();

    // Ask for a reconciliation now (network change notification). No-op when not running.
    void Kick();

    // One poll-and-reconcile step on the calling thread.
    void ReconcileOnce();

    // Reads state.json for reporting; the route table is not touched.
    void LoadState();

    // Swap the service catalog: dropped/disabled services lose their routes, new ones get them if connected.
    void UpdateServices(std::map<std::string, ServiceDefinition> services);

    LoopStatus     Status() const;
    PersistedState State() const;
    bool           IsConnected() const;
    bool           IsRunning() const { return running_.load(); }

private:
    void RunStep_();
    void ScheduleNext_();
    void Shutdown_();

    bool        OnConnected_();
    void        OnDisconnected_();
    void        VerifyAndRestore_();
    bool        ApplyService_(const std::string &key, const ServiceDefinition &svc, const std::string &gateway);
    void        PurgeLeftovers_();
    void        Persist_();

private:
    ConnectivityDetector &detector_;
    GatewayResolver      &resolver_;
    RouteTable           &routes_;
    StateStore           &store_;
    LoopOptions           opts_;

    // step_mu_ serializes whole steps; mu_ guards the fields below for readers
    std::mutex         step_mu_;
    mutable std::mutex mu_;

    std::map<std::string, ServiceDefinition> services_;
    PersistedState                           state_;
    bool                                     connected_      = false;
    bool                                     first_poll_     = true;
    bool                                     restore_failed_ = false;
    bool                                     prior_routes_active_ = false;
    std::string                              prior_gateway_;
    std::string                              tunnel_iface_;

    std::atomic<bool> running_{ false };
    std::atomic<bool> stopping_{ false };

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::jthread thread_;
};

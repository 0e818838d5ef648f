#pragma once

// RouteTable.hpp — the authoritative set of installed bypass routes.
//
// Only this class issues `route add/delete`. One mutex guards the table and every
// OS command, so mutations from the loop and from CLI callers are totally ordered.

#include "Core/Command.hpp"
#include "Network/Parsers.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct Route
{
    std::string                           network;  // CIDR as configured, the table key
    std::string                           gateway;
    std::string                           service;
    std::chrono::system_clock::time_point installed_at;
};

class RouteTable
{
public:
    explicit RouteTable(CommandRunner run);

    RouteTable(const RouteTable&)            = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    /**
     * @brief Installs network -> gateway and records it for `service`.
     *
     * Same (network, gateway) already tracked: no-op, no command issued.
     * Tracked with another gateway: the stale OS route is deleted first.
     * OS answers "File exists": the foreign route is replaced once.
     *
     * Throws RouteError on an invalid CIDR/gateway or if the OS refuses the route.
     */
    void Add(const std::string &network, const std::string &gateway, const std::string &service);

    /**
     * @brief Deletes the OS route and forgets it.
     *
     * "not in table" counts as success. Any other failure throws RouteError
     * and leaves the entry tracked. Untracked networks are still deleted from the OS.
     */
    void Remove(const std::string &network);

    // Deletes and forgets every entry. Failures are collected into one RouteError thrown at the end.
    void RemoveAll();

    // Same as RemoveAll but only for routes owned by `service`.
    void RemoveService(const std::string &service);

    // Tracked and present in `netstat -rn` with the recorded gateway.
    bool Verify(const std::string &network);

    // One netstat snapshot for every tracked route.
    std::map<std::string, bool> VerifyAll();

    /**
     * @brief Re-adds tracked routes toward `gateway` and records the new gateway.
     *
     * @param networks subset to restore; empty = every tracked route
     * Throws an aggregated RouteError for the routes that could not be re-added.
     */
    void Restore(const std::string &gateway, const std::vector<std::string> &networks = {});

    /**
     * @brief Deletes untracked OS routes for `networks` that still point at `gateway`.
     *
     * Used after a restart to clean up what a previous process left behind.
     * @return number of routes deleted
     */
    std::size_t PurgeStale(const std::vector<std::string> &networks, const std::string &gateway);

    std::vector<Route> ActiveRoutes() const;
    std::size_t        Count() const;
    std::size_t        CountForService(const std::string &service) const;

private:
    enum class DeleteResult
    {
        Removed,
        Absent,
        Failed
    };

    CommandResult AddCommand_(const std::string &network, const std::string &gateway);
    DeleteResult  DeleteCommand_(const std::string &network, std::string &detail);
    CommandResult InstallWithAdoption_(const std::string &network, const std::string &gateway);
    void          RemoveWhere_(const std::string &what, bool (*match)(const Route &, const std::string &),
                               const std::string &arg);

    bool Present_(const std::vector<Parsers::RouteRow> &rows, const Route &r) const;
    bool Snapshot_(std::vector<Parsers::RouteRow> &rows);

private:
    CommandRunner                run_;
    mutable std::mutex           mu_;
    std::map<std::string, Route> routes_;
};

#pragma once

// StateStore.hpp — last known connectivity/route state in <state_dir>/state.json, plus the daemon PID file.
//
// The snapshot is a cache for `status`, never a source of truth for the route table.

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <sys/types.h>

using TimePoint = std::chrono::system_clock::time_point;

struct PersistedState
{
    bool                        vpn_connected = false;
    bool                        routes_active = false;
    std::map<std::string, bool> active_services;
    std::string                 last_gateway;
    TimePoint                   last_check{};
    TimePoint                   start_time{};
    std::string                 version = "1.0.0";

    bool operator==(const PersistedState &o) const;
    bool operator!=(const PersistedState &o) const { return !(*this == o); }
};

namespace Timestamps
{
    // system_clock::now() truncated to milliseconds (what survives a save/load)
    TimePoint NowMs();

    // "2024-05-01T10:20:30.123Z"
    std::string Format(TimePoint tp);

    // Accepts the Format() output, with or without fractional seconds; "Z" or "+hh:mm" offsets.
    std::optional<TimePoint> Parse(const std::string &text);
}

class StateStore
{
public:
    explicit StateStore(std::string state_dir);

    /**
     * @brief Reads state.json.
     *
     * Missing file -> default PersistedState (first run).
     * Unreadable or malformed file -> PersistenceError.
     */
    PersistedState Load() const;

    // Atomic replace (state.json.tmp + rename). Throws PersistenceError.
    void Save(const PersistedState &state) const;

    const std::string &StatePath() const { return state_path_; }
    const std::string &PidPath() const { return pid_path_; }

    // PID file helpers. WritePid/RemovePid throw PersistenceError.
    void                 WritePid(pid_t pid) const;
    void                 RemovePid() const;
    std::optional<pid_t> ReadPid() const;

    // PID file present and the process answers kill(pid, 0).
    bool IsDaemonRunning() const;

private:
    std::string state_dir_;
    std::string state_path_;
    std::string pid_path_;
};

#include "Service/StateStore.hpp"
#include "Core/AtomicFile.hpp"
#include "Core/Errors.hpp"
#include "Core/Json.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>

#include <signal.h>
#include <unistd.h>

namespace Timestamps
{
    TimePoint NowMs()
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    std::string Format(TimePoint tp)
    {
        using namespace std::chrono;
        const auto ms_total = duration_cast<milliseconds>(tp.time_since_epoch()).count();
        std::time_t secs = static_cast<std::time_t>(ms_total / 1000);
        int         ms   = static_cast<int>(ms_total % 1000);
        if (ms < 0)
        {
            ms += 1000;
            secs -= 1;
        }

        std::tm tm{};
        ::gmtime_r(&secs, &tm);

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
        return buf;
    }

    std::optional<TimePoint> Parse(const std::string &text)
    {
        std::tm tm{};
        int     consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        {
            return std::nullopt;
        }
        tm.tm_year -= 1900;
        tm.tm_mon  -= 1;

        std::size_t pos = static_cast<std::size_t>(consumed);

        // fraction: keep milliseconds, drop the rest
        long ms = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            int digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (digits < 3) ms = ms * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (int d = digits; d < 3; ++d) ms *= 10;
        }

        long offset = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
            offset = (oh * 3600L + om * 60L) * (text[pos] == '+' ? 1 : -1);
            pos += 6;
        }
        else
        {
            return std::nullopt;
        }
        if (pos != text.size()) return std::nullopt;

        const std::time_t secs = ::timegm(&tm) - offset;
        return TimePoint(std::chrono::seconds(secs) + std::chrono::milliseconds(ms));
    }
}

bool PersistedState::operator==(const PersistedState &o) const
{
    return vpn_connected == o.vpn_connected
           && routes_active == o.routes_active
           && active_services == o.active_services
           && last_gateway == o.last_gateway
           && last_check == o.last_check
           && start_time == o.start_time
           && version == o.version;
}

StateStore::StateStore(std::string state_dir)
        : state_dir_(std::move(state_dir))
        , state_path_((std::filesystem::path(state_dir_) / "state.json").string())
        , pid_path_((std::filesystem::path(state_dir_) / "daemon.pid").string())
{
}

PersistedState StateStore::Load() const
{
    PersistedState st;

    auto text = AtomicFile::Read(state_path_);
    if (!text)
    {
        LOGD("state") << "No state file at " << state_path_ << ", starting fresh";
        return st;
    }

    try
    {
        auto jv = Json::Parse(*text);
        if (!jv.is_object())
        {
            throw std::runtime_error("root is not an object");
        }
        const auto &o = jv.get_object();

        st.vpn_connected = Json::GetBool(o, "vpn_connected", false);
        st.routes_active = Json::GetBool(o, "routes_active", false);
        st.last_gateway  = Json::GetString(o, "last_gateway", "");
        st.version       = Json::GetString(o, "version", st.version);

        if (const auto *svcs = o.if_contains("active_services"); svcs != nullptr && !svcs->is_null())
        {
            if (!svcs->is_object())
            {
                throw std::runtime_error("field 'active_services' must be an object");
            }
            for (const auto &kv : svcs->get_object())
            {
                if (!kv.value().is_bool())
                {
                    throw std::runtime_error("active_services values must be booleans");
                }
                st.active_services[Json::ToString(kv.key())] = kv.value().get_bool();
            }
        }

        auto read_time = [&o](const char *key, TimePoint &dst)
        {
            const std::string s = Json::GetString(o, key, "");
            if (s.empty()) return;
            auto tp = Timestamps::Parse(s);
            if (!tp)
            {
                throw std::runtime_error(std::string("field '") + key + "' is not an RFC 3339 timestamp");
            }
            dst = *tp;
        };
        read_time("last_check", st.last_check);
        read_time("start_time", st.start_time);
    }
    catch (const std::exception &e)
    {
        throw PersistenceError("failed to parse state file " + state_path_ + ": " + e.what());
    }

    return st;
}

void StateStore::Save(const PersistedState &state) const
{
    boost::json::object services;
    for (const auto &[name, active] : state.active_services)
    {
        services[name] = active;
    }

    boost::json::object o;
    o["vpn_connected"]   = state.vpn_connected;
    o["routes_active"]   = state.routes_active;
    o["active_services"] = std::move(services);
    o["last_check"]      = Timestamps::Format(state.last_check);
    o["start_time"]      = Timestamps::Format(state.start_time);
    o["last_gateway"]    = state.last_gateway;
    o["version"]         = state.version;

    AtomicFile::Write(state_path_, Json::Pretty(o));
    LOGT("state") << "Saved " << state_path_;
}

void StateStore::WritePid(pid_t pid) const
{
    AtomicFile::Write(pid_path_, std::to_string(pid));
}

void StateStore::RemovePid() const
{
    if (::unlink(pid_path_.c_str()) != 0 && errno != ENOENT)
    {
        throw PersistenceError("failed to remove PID file " + pid_path_ + ": " + std::strerror(errno));
    }
}

std::optional<pid_t> StateStore::ReadPid() const
{
    std::optional<std::string> text;
    try
    {
        text = AtomicFile::Read(pid_path_);
    }
    catch (const PersistenceError &e)
    {
        LOGW("state") << e.what();
        return std::nullopt;
    }
    if (!text) return std::nullopt;

    long pid = 0;
    if (std::sscanf(text->c_str(), "%ld", &pid) != 1 || pid <= 0)
    {
        LOGW("state") << "Invalid PID file " << pid_path_;
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool StateStore::IsDaemonRunning() const
{
    auto pid = ReadPid();
    if (!pid) return false;
    // EPERM: exists but owned by someone else (daemon runs as root)
    return ::kill(*pid, 0) == 0 || errno == EPERM;
}

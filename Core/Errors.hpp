#pragma once

// Errors.hpp — exception types shared by the routing core.

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Gateway or VPN state could not be determined. Recoverable: retried on the next tick.
class DetectionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An OS route add/delete failed. Carries the affected networks.
class RouteError : public std::runtime_error
{
public:
    RouteError(const std::string &what, std::vector<std::string> networks)
        : std::runtime_error(what)
        , networks_(std::move(networks))
    {
    }

    RouteError(const std::string &what, const std::string &network)
        : std::runtime_error(what)
        , networks_{ network }
    {
    }

    const std::vector<std::string> &Networks() const noexcept { return networks_; }

private:
    std::vector<std::string> networks_;
};

// State or PID file could not be read or written.
class PersistenceError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Configuration is unreadable or fails validation.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

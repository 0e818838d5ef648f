#pragma once

// NetWatcher.hpp — Linux: listens for link/address/route changes on rtnetlink and,
// after a quiet period (debounce), calls on_change(). The daemon uses it to kick the
// reconciliation loop so a tunnel coming up is seen before the next tick.

#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

class NetWatcher
{
public:
    using ChangeFn = std::function<void()>;

    explicit NetWatcher(ChangeFn on_change,
                        std::chrono::milliseconds debounce = std::chrono::milliseconds(1000));

    ~NetWatcher();

    NetWatcher(const NetWatcher&)            = delete;
    NetWatcher& operator=(const NetWatcher&) = delete;
    NetWatcher(NetWatcher&&)                 = delete;
    NetWatcher& operator=(NetWatcher&&)      = delete;

    // Queue a notification (coalesced by debounce)
    void Kick();

    void Stop();

    // false if netlink setup failed; the daemon then relies on the timer only
    bool IsRunning() const;

private:
    bool Open_();
    void Close_();
    void ThreadLoop_(std::stop_token st);
    void WaitQuiet_(std::stop_token &st);

private:
    ChangeFn                  on_change_;
    std::chrono::milliseconds debounce_;

    struct nl_sock *nl_sock_ = nullptr;
    int             nl_fd_   = -1;
    int             stop_fd_ = -1;
    int             kick_fd_ = -1;
    std::jthread    thread_;
};

#include "Network/Linux/NetWatcher.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstdint>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <linux/rtnetlink.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/msg.h>
#include <netlink/handlers.h>

namespace
{
    int OnNlValid(struct nl_msg * /*msg*/, void *arg)
    {
        auto *self = static_cast<NetWatcher *>(arg);
        if (self != nullptr)
        {
            self->Kick();
        }
        return NL_OK;
    }

    void DrainEventFd(int fd)
    {
        std::uint64_t val = 0;
        while (true)
        {
            ssize_t rc = ::read(fd, &val, sizeof(val));
            if (rc < 0 && errno == EINTR) continue;
            return;
        }
    }

    void SignalEventFd(int fd)
    {
        if (fd < 0) return;
        std::uint64_t one = 1;
        // non-blocking; counter overflow just means "already signalled"
        (void)::write(fd, &one, sizeof(one));
    }
}

NetWatcher::NetWatcher(ChangeFn on_change, std::chrono::milliseconds debounce)
        : on_change_(std::move(on_change))
        , debounce_(debounce.count() > 0 ? debounce : std::chrono::milliseconds(1000))
{
    if (!Open_())
    {
        Close_();
        return;
    }

    thread_ = std::jthread([this](std::stop_token st) { ThreadLoop_(st); });
    LOGD("netwatcher") << "Armed (debounce=" << debounce_.count() << " ms)";
}

NetWatcher::~NetWatcher()
{
    Stop();
}

bool NetWatcher::IsRunning() const
{
    return thread_.joinable();
}

void NetWatcher::Kick()
{
    SignalEventFd(kick_fd_);
}

void NetWatcher::Stop()
{
    if (thread_.joinable())
    {
        thread_.request_stop();
        SignalEventFd(stop_fd_);
        thread_.join();
        LOGD("netwatcher") << "Stopped";
    }
    Close_();
}

bool NetWatcher::Open_()
{
    stop_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    kick_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0 || kick_fd_ < 0)
    {
        LOGE("netwatcher") << "eventfd create failed";
        return false;
    }

    nl_sock_ = nl_socket_alloc();
    if (!nl_sock_)
    {
        LOGE("netwatcher") << "nl_socket_alloc failed";
        return false;
    }

    if (nl_connect(nl_sock_, NETLINK_ROUTE) != 0)
    {
        LOGE("netwatcher") << "nl_connect(NETLINK_ROUTE) failed";
        return false;
    }

    int rc = nl_socket_add_memberships(nl_sock_,
                                       RTNLGRP_LINK,
                                       RTNLGRP_IPV4_IFADDR,
                                       RTNLGRP_IPV4_ROUTE,
                                       0);
    if (rc != 0)
    {
        LOGE("netwatcher") << "nl_socket_add_memberships rc=" << rc;
        return false;
    }

    nl_socket_disable_seq_check(nl_sock_);
    nl_socket_modify_cb(nl_sock_, NL_CB_VALID, NL_CB_CUSTOM, &OnNlValid, this);
    nl_socket_set_nonblocking(nl_sock_);
    nl_fd_ = nl_socket_get_fd(nl_sock_);
    return true;
}

void NetWatcher::Close_()
{
    if (nl_sock_ != nullptr)
    {
        nl_close(nl_sock_);
        nl_socket_free(nl_sock_);
        nl_sock_ = nullptr;
    }
    if (stop_fd_ >= 0) { ::close(stop_fd_); stop_fd_ = -1; }
    if (kick_fd_ >= 0) { ::close(kick_fd_); kick_fd_ = -1; }
    nl_fd_ = -1;
}

void NetWatcher::WaitQuiet_(std::stop_token &st)
{
    // keep swallowing kicks until debounce_ passes without one
    auto deadline = std::chrono::steady_clock::now() + debounce_;
    while (!st.stop_requested())
    {
        const auto left = deadline - std::chrono::steady_clock::now();
        if (left <= std::chrono::milliseconds(0)) return;

        const int timeout_ms = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(left).count());

        pollfd p[3] = {
                { stop_fd_, POLLIN, 0 },
                { kick_fd_, POLLIN, 0 },
                { nl_fd_,   POLLIN, 0 }
        };
        int rc = ::poll(p, 3, timeout_ms);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("netwatcher") << "poll(debounce) failed";
            return;
        }
        if (rc == 0) return;

        if (p[0].revents & POLLIN) return;
        if (p[2].revents & POLLIN)
        {
            (void)nl_recvmsgs_default(nl_sock_);
        }
        if (p[1].revents & POLLIN)
        {
            DrainEventFd(kick_fd_);
            deadline = std::chrono::steady_clock::now() + debounce_;
        }
    }
}

void NetWatcher::ThreadLoop_(std::stop_token st)
{
    LOGI("netwatcher") << "Thread started";

    while (!st.stop_requested())
    {
        pollfd pfds[3] = {
                { stop_fd_, POLLIN, 0 },
                { kick_fd_, POLLIN, 0 },
                { nl_fd_,   POLLIN, 0 }
        };

        int rc = ::poll(pfds, 3, -1);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("netwatcher") << "poll failed";
            break;
        }

        if (pfds[0].revents & POLLIN)
        {
            DrainEventFd(stop_fd_);
            break;
        }

        if (pfds[2].revents & POLLIN)
        {
            // OnNlValid turns every message into a Kick()
            (void)nl_recvmsgs_default(nl_sock_);
        }

        if (!(pfds[1].revents & POLLIN))
        {
            continue;
        }

        DrainEventFd(kick_fd_);
        WaitQuiet_(st);
        if (st.stop_requested()) break;

        try
        {
            LOGD("netwatcher") << "Network change, notifying";
            on_change_();
        }
        catch (const std::exception &e)
        {
            LOGE("netwatcher") << "Change handler failed: " << e.what();
        }
    }

    LOGI("netwatcher") << "Thread exiting";
}

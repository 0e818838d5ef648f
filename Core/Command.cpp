#include "Core/Command.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    void CloseFd(int &fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    // pipe2() is missing on macOS
    bool MakePipe(int fds[2])
    {
        if (::pipe(fds) != 0) return false;
        for (int i = 0; i < 2; ++i)
        {
            if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) return false;
        }
        return true;
    }

    // Reads both pipes until EOF on each; poll() keeps one full pipe from blocking the other.
    void DrainPipes(int out_fd, int err_fd, std::string &out, std::string &err)
    {
        char buf[4096];
        int  fds[2] = { out_fd, err_fd };
        std::string *dst[2] = { &out, &err };

        while (fds[0] >= 0 || fds[1] >= 0)
        {
            pollfd pfds[2]{};
            nfds_t n = 0;
            int    map[2]{};
            for (int i = 0; i < 2; ++i)
            {
                if (fds[i] < 0) continue;
                pfds[n] = { fds[i], POLLIN, 0 };
                map[n]  = i;
                ++n;
            }

            int rc = ::poll(pfds, n, -1);
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                break;
            }

            for (nfds_t k = 0; k < n; ++k)
            {
                if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;

                const int i = map[k];
                ssize_t   r = ::read(fds[i], buf, sizeof(buf));
                if (r > 0)
                {
                    dst[i]->append(buf, static_cast<std::size_t>(r));
                }
                else if (r == 0 || (errno != EINTR && errno != EAGAIN))
                {
                    CloseFd(fds[i]);
                }
            }
        }

        CloseFd(fds[0]);
        CloseFd(fds[1]);
    }
}

std::string CommandResult::Combined() const
{
    if (err.empty()) return out;
    if (out.empty()) return err;
    return out + err;
}

std::string JoinArgv(const std::vector<std::string> &argv)
{
    std::string s;
    for (const auto &a : argv)
    {
        if (!s.empty()) s.push_back(' ');
        s += a;
    }
    return s;
}

CommandResult RunCommand(const std::vector<std::string> &argv)
{
    CommandResult res;
    if (argv.empty())
    {
        res.exit_code = 127;
        res.err       = "empty command";
        return res;
    }

    int out_pipe[2] = { -1, -1 };
    int err_pipe[2] = { -1, -1 };
    if (!MakePipe(out_pipe) || !MakePipe(err_pipe))
    {
        res.exit_code = 127;
        res.err       = std::string("pipe: ") + std::strerror(errno);
        CloseFd(out_pipe[0]); CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]); CloseFd(err_pipe[1]);
        return res;
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &a : argv) cargv.push_back(const_cast<char *>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        res.exit_code = 127;
        res.err       = std::string("fork: ") + std::strerror(errno);
        CloseFd(out_pipe[0]); CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]); CloseFd(err_pipe[1]);
        return res;
    }

    if (pid == 0)
    {
        // child: only async-signal-safe calls from here on
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

        ::execvp(cargv[0], cargv.data());

        const char *msg = "exec failed: ";
        (void)::write(STDERR_FILENO, msg, std::strlen(msg));
        const char *why = std::strerror(errno);
        (void)::write(STDERR_FILENO, why, std::strlen(why));
        ::_exit(127);
    }

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    DrainPipes(out_pipe[0], err_pipe[0], res.out, res.err);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno == EINTR) continue;
        res.exit_code = 127;
        res.err += std::string("waitpid: ") + std::strerror(errno);
        LOGW("cmd") << JoinArgv(argv) << " -> waitpid failed";
        return res;
    }

    if (WIFEXITED(status))        res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);

    LOGT("cmd") << JoinArgv(argv) << " -> rc=" << res.exit_code;
    return res;
}

#include "Core/AtomicFile.hpp"
#include "Core/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace
{
    std::string Errno(const char *what, const std::string &path)
    {
        return std::string(what) + " " + path + ": " + std::strerror(errno);
    }

    bool WriteAll(int fd, const char *p, std::size_t n)
    {
        while (n > 0)
        {
            ssize_t w = ::write(fd, p, n);
            if (w < 0)
            {
                if (errno == EINTR) continue;
                return false;
            }
            p += w;
            n -= static_cast<std::size_t>(w);
        }
        return true;
    }
}

namespace AtomicFile
{
    void Write(const std::string &path, const std::string &data, mode_t mode)
    {
        const std::filesystem::path target(path);
        if (target.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw PersistenceError("cannot create directory " + target.parent_path().string()
                                       + ": " + ec.message());
            }
        }

        const std::string tmp = path + ".tmp";
        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
        if (fd < 0)
        {
            throw PersistenceError(Errno("open", tmp));
        }

        if (!WriteAll(fd, data.data(), data.size()))
        {
            const std::string msg = Errno("write", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            throw PersistenceError(msg);
        }

        if (::fsync(fd) != 0)
        {
            const std::string msg = Errno("fsync", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            throw PersistenceError(msg);
        }

        if (::close(fd) != 0)
        {
            const std::string msg = Errno("close", tmp);
            ::unlink(tmp.c_str());
            throw PersistenceError(msg);
        }

        if (::rename(tmp.c_str(), path.c_str()) != 0)
        {
            const std::string msg = Errno("rename", tmp);
            ::unlink(tmp.c_str());
            throw PersistenceError(msg);
        }
    }

    std::optional<std::string> Read(const std::string &path)
    {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            if (errno == ENOENT) return std::nullopt;
            throw PersistenceError(Errno("open", path));
        }

        std::string data;
        char        buf[4096];
        while (true)
        {
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r < 0)
            {
                if (errno == EINTR) continue;
                const std::string msg = Errno("read", path);
                ::close(fd);
                throw PersistenceError(msg);
            }
            if (r == 0) break;
            data.append(buf, static_cast<std::size_t>(r));
        }
        ::close(fd);
        return data;
    }
}

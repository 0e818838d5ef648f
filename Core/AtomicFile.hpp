#pragma once

// AtomicFile.hpp — whole-file read and crash-safe replace (write tmp, fsync, rename).

#include <optional>
#include <string>

#include <sys/types.h>

namespace AtomicFile
{
    /**
     * @brief Replaces `path` with `data`.
     *
     * Writes `<path>.tmp` in the same directory, fsyncs it and renames it over `path`,
     * so readers see either the old or the new content. Parent directories are created.
     * Throws PersistenceError; the temporary file is removed on failure.
     */
    void Write(const std::string &path, const std::string &data, mode_t mode = 0644);

    // nullopt if the file does not exist; throws PersistenceError on any other read error.
    std::optional<std::string> Read(const std::string &path);
}

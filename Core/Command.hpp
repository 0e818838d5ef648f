#pragma once

// Command.hpp — запуск системных утилит без shell: fork/execvp, stdout/stderr через pipe.

#include <functional>
#include <string>
#include <vector>

struct CommandResult
{
    int         exit_code = -1;   // 0..255; 128+sig if killed; 127 if exec failed
    std::string out;
    std::string err;

    bool Ok() const noexcept { return exit_code == 0; }

    // stdout + stderr, as a user would see them in a terminal
    std::string Combined() const;
};

// Seam for everything that talks to the OS. Production code passes RunCommand.
using CommandRunner = std::function<CommandResult(const std::vector<std::string> &argv)>;

/**
 * @brief Runs argv[0] (looked up in PATH) with the remaining arguments.
 *
 * No shell is involved. Blocks until the child exits; no extra timeout is imposed,
 * bounded utilities (ping -W) bring their own.
 * Never throws for child failures: spawn errors are reported as exit_code 127 with errno text in err.
 */
CommandResult RunCommand(const std::vector<std::string> &argv);

// "route -n add -net 1.2.3.0/24 10.0.0.1" — for logs
std::string JoinArgv(const std::vector<std::string> &argv);

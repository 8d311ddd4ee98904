// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <initializer_list>
#include <mutex>

#include <sys/wait.h>

#include <poll.h>

#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolgate
{

namespace
{
    /// @brief Writes to a pipe whose reader has exited must fail with EPIPE, not kill the router.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }
} // namespace

struct StdioTransport::Impl
{
    std::string command;
    pid_t childPid = -1;
    std::atomic<bool> connected = false;
    std::mutex closeMutex;

    // Guarded by writeMutex.
    std::mutex writeMutex;
    int stdinWrite = -1;

    // Guarded by readMutex. close() writes to wakeWrite to interrupt a blocked reader and only
    // closes these descriptors once the reader let go of them.
    std::mutex readMutex;
    int stdoutRead = -1;
    int wakeRead = -1;
    std::string readBuffer;

    int wakeWrite = -1;
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::buildEnvironment(char** inherited, const std::map<std::string, std::string>& overrides)
    -> std::vector<std::string>
{
    auto merged = std::map<std::string, std::string> {};
    if (inherited)
    {
        for (auto** e = inherited; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq == std::string_view::npos)
                continue;
            merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
        }
    }

    for (const auto& [key, value]: overrides)
        merged[key] = value;

    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(merged.size());
    for (const auto& [key, value]: merged)
        envStrings.push_back(std::format("{}={}", key, value));
    return envStrings;
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command configured for stdio transport");

    ignoreSigpipe();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe(stdinPipe) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (pipe(stdoutPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(environ, config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    int wakePipe[2];
    if (pipe(wakePipe) != 0)
    {
        kill(pid, SIGTERM);
        waitpid(pid, nullptr, 0);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError, "Failed to create wake-up pipe");
    }

    _impl->command = config.command;
    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->wakeRead = wakePipe[0];
    _impl->wakeWrite = wakePipe[1];
    _impl->connected = true;
    log::debug("Spawned tool server '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto lock = std::lock_guard(_impl->writeMutex);
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_impl->readMutex);
    if (!_impl->connected || _impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto fds = std::array<pollfd, 2> {
            pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            pollfd { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        };
        if (::poll(fds.data(), static_cast<nfds_t>(fds.size()), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("Failed to poll process stdout: {}", strerror(errno)));
        }
        if (fds[1].revents != 0)
            return makeError(ErrorCode::TransportError, "Transport closed");

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    auto lock = std::lock_guard(_impl->closeMutex);
    _impl->connected = false;

    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const written = ::write(_impl->wakeWrite, &byte, 1);
    }

    // Terminated before taking the write lock, so a writer stuck on a full pipe gets EPIPE.
    if (_impl->childPid > 0)
        kill(_impl->childPid, SIGTERM);

    {
        auto writeLock = std::lock_guard(_impl->writeMutex);
        if (_impl->stdinWrite >= 0)
        {
            ::close(_impl->stdinWrite);
            _impl->stdinWrite = -1;
        }
    }

    if (_impl->childPid > 0)
    {
        int status;
        waitpid(_impl->childPid, &status, 0);
        log::debug("Tool server '{}' (pid {}) terminated", _impl->command, _impl->childPid);
        _impl->childPid = -1;
    }

    {
        auto readLock = std::lock_guard(_impl->readMutex);
        for (auto* fd: { &_impl->stdoutRead, &_impl->wakeRead })
        {
            if (*fd >= 0)
            {
                ::close(*fd);
                *fd = -1;
            }
        }
    }

    if (_impl->wakeWrite >= 0)
    {
        ::close(_impl->wakeWrite);
        _impl->wakeWrite = -1;
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace toolgate

#include <mcphub/transport/process_host.hpp>

#include <mcphub/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <optional>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcphub {

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);
constexpr auto kReapPollInterval = std::chrono::milliseconds(20);
// Longest single poll on a child's stdout, so a reader notices Terminate.
constexpr auto kReadSlice = std::chrono::milliseconds(100);

Error MakeProcessError(const std::string& operation, const std::string& server_id,
                       const std::string& message,
                       ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, server_id, std::nullopt, message, std::nullopt, category};
}

std::string ErrnoMessage(int err) {
    return std::strerror(err);
}

// Parent environment overlaid with the configured variables.
std::vector<std::string> BuildEnvironment(const EnvMap& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        auto eq = var.find('=');
        if (eq != std::string::npos && overrides.count(var.substr(0, eq)) > 0) {
            continue;
        }
        env.push_back(std::move(var));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

bool WriteAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void IgnoreSigpipeOnce() {
    // A write to an exited child must fail with EPIPE, not kill this process.
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Process: one spawned server.
// ---------------------------------------------------------------------------
struct ProcessHost::Process {
    std::string server_id;
    std::string command;
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    std::string read_buffer;
    std::atomic<bool> alive{true};
    std::mutex io_mutex;   // serializes round trips and guards the fds

    enum class ReadStatus { Line, Eof, Timeout, Failed, Stopped };

    // Read one '\n'-terminated line, waiting until `deadline` (if set).
    // Returns Stopped once the process is marked dead, even if a grandchild
    // still holds the pipe open.
    ReadStatus ReadLine(std::string& line,
                        std::optional<std::chrono::steady_clock::time_point> deadline) {
        while (true) {
            auto newline = read_buffer.find('\n');
            if (newline != std::string::npos) {
                line = read_buffer.substr(0, newline);
                read_buffer.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return ReadStatus::Line;
            }

            if (!alive.load()) {
                return ReadStatus::Stopped;
            }
            auto slice = kReadSlice;
            if (deadline.has_value()) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    return ReadStatus::Timeout;
                }
                slice = std::min(slice, remaining);
            }
            pollfd pfd{stdout_fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ReadStatus::Failed;
            }
            if (ready == 0) {
                continue;
            }

            char chunk[4096];
            auto n = ::read(stdout_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                return ReadStatus::Failed;
            }
            if (n == 0) {
                return ReadStatus::Eof;
            }
            read_buffer.append(chunk, static_cast<size_t>(n));
        }
    }
};

ProcessHost::ProcessHost() {
    IgnoreSigpipeOnce();
}

ProcessHost::~ProcessHost() {
    std::map<std::string, std::shared_ptr<Process>> processes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes.swap(processes_);
    }
    for (auto& [id, process] : processes) {
        Terminate(*process);
    }
}

Result<void, Error> ProcessHost::Connect(const std::string& server_id,
                                         const StdioTransportConfig& config) {
    // Restart semantics: never two processes for one id.
    Disconnect(server_id);

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        return Result<void, Error>::Err(MakeProcessError(
            "ProcessConnect", server_id, "pipe() failed: " + ErrnoMessage(errno)));
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return Result<void, Error>::Err(MakeProcessError(
            "ProcessConnect", server_id, "pipe() failed: " + ErrnoMessage(err)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);

    std::vector<std::string> arg_strings;
    arg_strings.push_back(config.command);
    arg_strings.insert(arg_strings.end(), config.args.begin(), config.args.end());
    auto argv = ToArgv(arg_strings);
    auto env_strings = BuildEnvironment(config.env);
    auto envp = ToArgv(env_strings);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, config.command.c_str(), &actions, nullptr,
                            argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);

    if (rc != 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        return Result<void, Error>::Err(MakeProcessError(
            "ProcessConnect", server_id,
            "Failed to spawn '" + config.command + "': " + ErrnoMessage(rc)));
    }

    auto process = std::make_shared<Process>();
    process->server_id = server_id;
    process->command = config.command;
    process->pid = pid;
    process->stdin_fd = in_pipe[1];
    process->stdout_fd = out_pipe[0];

    LogInfo("process", "Started " + server_id + " (pid " + std::to_string(pid) + "): " +
                           config.command);
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[server_id] = std::move(process);
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ProcessHost::SendRequest(
    const std::string& server_id,
    const std::string& request_line,
    std::chrono::milliseconds timeout) {
    auto process = Find(server_id);
    if (!process) {
        return Result<std::string, Error>::Err(MakeProcessError(
            "ProcessRequest", server_id, "MCP server not found: " + server_id));
    }

    auto request = nlohmann::json::parse(request_line, nullptr, false);
    nlohmann::json request_id;
    if (!request.is_discarded() && request.is_object() && request.contains("id")) {
        request_id = request["id"];
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }

    std::lock_guard<std::mutex> io_lock(process->io_mutex);
    if (!process->alive.load() || process->stdin_fd < 0) {
        return Result<std::string, Error>::Err(MakeProcessError(
            "ProcessRequest", server_id, "MCP server process is not running: " + server_id));
    }
    if (!WriteAll(process->stdin_fd, request_line + "\n")) {
        int err = errno;
        process->alive.store(false);
        return Result<std::string, Error>::Err(MakeProcessError(
            "ProcessRequest", server_id,
            "Failed to write to MCP server stdin: " + ErrnoMessage(err)));
    }

    std::string line;
    while (true) {
        auto status = process->ReadLine(line, deadline);
        if (status == Process::ReadStatus::Timeout) {
            return Result<std::string, Error>::Err(MakeProcessError(
                "ProcessRequest", server_id,
                "No response within " + std::to_string(timeout.count()) + " ms",
                ErrorCategory::Timeout));
        }
        if (status == Process::ReadStatus::Stopped) {
            return Result<std::string, Error>::Err(MakeProcessError(
                "ProcessRequest", server_id, "MCP server process was stopped: " + server_id));
        }
        if (status == Process::ReadStatus::Eof) {
            process->alive.store(false);
            return Result<std::string, Error>::Err(MakeProcessError(
                "ProcessRequest", server_id, "MCP server process ended unexpectedly (EOF)"));
        }
        if (status == Process::ReadStatus::Failed) {
            process->alive.store(false);
            return Result<std::string, Error>::Err(MakeProcessError(
                "ProcessRequest", server_id,
                "Failed to read MCP server stdout: " + ErrnoMessage(errno)));
        }

        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] != '{') {
            if (first != std::string::npos) {
                LogDebug("process", server_id + " (non-JSON): " + line);
            }
            continue;
        }
        if (request_id.is_null()) {
            return Result<std::string, Error>::Ok(std::move(line));
        }
        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            // Not ours to judge; the caller reports malformed replies.
            return Result<std::string, Error>::Ok(std::move(line));
        }
        if (message.contains("id") && message["id"] == request_id) {
            return Result<std::string, Error>::Ok(std::move(line));
        }
        LogDebug("process", server_id + " skipped message: " + line);
    }
}

Result<void, Error> ProcessHost::SendNotification(const std::string& server_id,
                                                  const std::string& line) {
    auto process = Find(server_id);
    if (!process) {
        return Result<void, Error>::Err(MakeProcessError(
            "ProcessNotify", server_id, "MCP server not found: " + server_id));
    }
    std::lock_guard<std::mutex> io_lock(process->io_mutex);
    if (!process->alive.load() || process->stdin_fd < 0 ||
        !WriteAll(process->stdin_fd, line + "\n")) {
        return Result<void, Error>::Err(MakeProcessError(
            "ProcessNotify", server_id, "MCP server process is not running: " + server_id));
    }
    return Result<void, Error>::Ok();
}

void ProcessHost::Disconnect(const std::string& server_id) {
    std::shared_ptr<Process> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(server_id);
        if (it == processes_.end()) {
            return;
        }
        process = std::move(it->second);
        processes_.erase(it);
    }
    Terminate(*process);
}

bool ProcessHost::IsConnected(const std::string& server_id) const {
    auto process = Find(server_id);
    return process && process->alive.load();
}

std::shared_ptr<ProcessHost::Process> ProcessHost::Find(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(server_id);
    return it == processes_.end() ? nullptr : it->second;
}

void ProcessHost::Terminate(Process& process) {
    process.alive.store(false);
    if (process.pid > 0) {
        ::kill(process.pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        int status = 0;
        pid_t reaped = 0;
        while ((reaped = ::waitpid(process.pid, &status, WNOHANG)) == 0 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kReapPollInterval);
        }
        if (reaped == 0) {
            LogWarn("process", process.server_id + " ignored SIGTERM, sending SIGKILL");
            ::kill(process.pid, SIGKILL);
            ::waitpid(process.pid, &status, 0);
        }
        LogInfo("process", "Stopped " + process.server_id + " (pid " +
                               std::to_string(process.pid) + ")");
        process.pid = -1;
    }

    // A reader in ReadLine sees alive == false within one read slice, even
    // when a grandchild keeps stdout open, and then releases io_mutex.
    std::lock_guard<std::mutex> io_lock(process.io_mutex);
    if (process.stdin_fd >= 0) {
        ::close(process.stdin_fd);
        process.stdin_fd = -1;
    }
    if (process.stdout_fd >= 0) {
        ::close(process.stdout_fd);
        process.stdout_fd = -1;
    }
}

} // namespace mcphub

#pragma once

#include <mcphub/transport/i_process_host.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// ProcessHost: POSIX IProcessHost built on posix_spawnp and pipes.
//
// The child's stdin/stdout are pipes owned here; stderr is inherited so
// server diagnostics reach the user's terminal. Round trips on one process
// are serialized; different processes run independently.
// ---------------------------------------------------------------------------
class ProcessHost : public IProcessHost {
public:
    ProcessHost();
    ~ProcessHost() override;

    Result<void, Error> Connect(const std::string& server_id,
                                const StdioTransportConfig& config) override;

    Result<std::string, Error> SendRequest(
        const std::string& server_id,
        const std::string& request_line,
        std::chrono::milliseconds timeout) override;

    Result<void, Error> SendNotification(const std::string& server_id,
                                         const std::string& line) override;

    void Disconnect(const std::string& server_id) override;

    [[nodiscard]] bool IsConnected(const std::string& server_id) const override;

private:
    struct Process;

    std::shared_ptr<Process> Find(const std::string& server_id) const;
    static void Terminate(Process& process);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Process>> processes_;
};

} // namespace mcphub

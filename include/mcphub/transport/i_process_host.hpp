#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/protocol/types.hpp>

#include <chrono>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// IProcessHost: owns server subprocesses and exchanges newline-delimited
// JSON with them over stdin/stdout, keyed by server id.
// ---------------------------------------------------------------------------
class IProcessHost {
public:
    virtual ~IProcessHost() = default;

    // Spawn the server. An existing process for the same id is terminated first.
    virtual Result<void, Error> Connect(const std::string& server_id,
                                        const StdioTransportConfig& config) = 0;

    // Write one request line and return the reply line carrying the same id.
    // A zero timeout waits indefinitely.
    virtual Result<std::string, Error> SendRequest(
        const std::string& server_id,
        const std::string& request_line,
        std::chrono::milliseconds timeout) = 0;

    virtual Result<void, Error> SendNotification(const std::string& server_id,
                                                 const std::string& line) = 0;

    // Terminate and reap the process. Unknown ids are ignored.
    virtual void Disconnect(const std::string& server_id) = 0;

    [[nodiscard]] virtual bool IsConnected(const std::string& server_id) const = 0;

    IProcessHost(const IProcessHost&) = delete;
    IProcessHost& operator=(const IProcessHost&) = delete;
    IProcessHost(IProcessHost&&) = delete;
    IProcessHost& operator=(IProcessHost&&) = delete;

protected:
    IProcessHost() = default;
};

} // namespace mcphub

#pragma once

#include <mcphub/transport/i_http_client.hpp>
#include <mcphub/transport/i_process_host.hpp>
#include <mcphub/transport/i_transport.hpp>

#include <functional>
#include <memory>

namespace mcphub {

// Builds the transport for a server. Injected into the registry so tests can
// substitute scripted transports.
using TransportFactory =
    std::function<std::unique_ptr<ITransport>(const ServerConfig& config)>;

// Build the transport variant matching `config.transport`.
std::unique_ptr<ITransport> MakeTransport(const ServerConfig& config,
                                          IProcessHost& process_host,
                                          IHttpClient& http,
                                          const TransportOptions& options);

// Factory bound to the given collaborators. They must outlive the factory.
TransportFactory MakeTransportFactory(IProcessHost& process_host,
                                      IHttpClient& http,
                                      TransportOptions options);

} // namespace mcphub

#include <mcphub/transport/transport_factory.hpp>

#include <mcphub/transport/http_transport.hpp>
#include <mcphub/transport/sse_transport.hpp>
#include <mcphub/transport/stdio_transport.hpp>

namespace mcphub {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

std::unique_ptr<ITransport> MakeTransport(const ServerConfig& config,
                                          IProcessHost& process_host,
                                          IHttpClient& http,
                                          const TransportOptions& options) {
    return std::visit(
        Overloaded{
            [&](const StdioTransportConfig& stdio) -> std::unique_ptr<ITransport> {
                return std::make_unique<StdioTransport>(process_host, config.id, stdio,
                                                        options);
            },
            [&](const SseTransportConfig& sse) -> std::unique_ptr<ITransport> {
                return std::make_unique<SseTransport>(http, sse, options);
            },
            [&](const HttpTransportConfig& plain) -> std::unique_ptr<ITransport> {
                return std::make_unique<HttpTransport>(http, plain, options);
            },
        },
        config.transport);
}

TransportFactory MakeTransportFactory(IProcessHost& process_host,
                                      IHttpClient& http,
                                      TransportOptions options) {
    return [&process_host, &http, options](const ServerConfig& config) {
        return MakeTransport(config, process_host, http, options);
    };
}

} // namespace mcphub

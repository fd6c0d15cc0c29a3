#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/dynamic/dynamic_service.hpp>
#include <mcphub/dynamic/i_confirm_prompt.hpp>
#include <mcphub/dynamic/i_file_system.hpp>
#include <mcphub/dynamic/i_runtime_probe.hpp>
#include <mcphub/persistence/i_key_value_store.hpp>
#include <mcphub/registry/connection_registry.hpp>
#include <mcphub/registry/state_store.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

// True for registry ids owned by a dynamic service ("ai-svc-<serviceId>").
// Those servers are only started by DynamicServiceManager.
[[nodiscard]] bool IsDynamicServerId(std::string_view server_id);

struct DynamicServiceOptions {
    std::filesystem::path data_dir;
    std::string interpreter = "node";
    int min_major_version = 18;
    bool auto_approve = false;
    // Apply the security gate to saved services relaunched by Init().
    bool confirm_saved_on_startup = false;
};

// ---------------------------------------------------------------------------
// DynamicServiceManager: creates, persists, reconnects and removes services
// whose tool code is generated at runtime.
//
// Each service gets its own directory holding `definition.json` and
// `handlers.js`; one shared runtime script serves all of them, launched as a
// stdio server through the ConnectionRegistry. Nothing generated is run
// before the security gate approves it, unless auto-approve is on.
//
// Layout under data_dir:
//   mcp-services/runtime/mcp-runtime.js
//   mcp-services/saved/<serviceId>/
//   mcp-services/temp/<serviceId>/
//   dynamic-mcp-services.json      (key "savedServices")
// ---------------------------------------------------------------------------
class DynamicServiceManager {
public:
    using CreatedListener = std::function<void(const ServiceCreatedEvent&)>;

    // All collaborators must outlive the manager.
    DynamicServiceManager(DynamicServiceOptions options,
                          ConnectionRegistry& registry,
                          IKeyValueStore& store,
                          IFileSystem& fs,
                          IConfirmPrompt& prompt,
                          IRuntimeProbe& probe);

    DynamicServiceManager(const DynamicServiceManager&) = delete;
    DynamicServiceManager& operator=(const DynamicServiceManager&) = delete;

    // Probe the interpreter, then load and reconnect saved services. A too-old
    // or missing interpreter disables the feature; it is not an error.
    void Init();

    // Write the shared runtime script once. Returns its path.
    Result<std::filesystem::path, Error> EnsureRuntime();

    Result<DynamicService, Error> CreateService(const CreateServiceParams& params);

    // Move a temp service's files into the saved area. No-op when already saved.
    Result<void, Error> SaveService(const std::string& service_id);

    // Disconnect, unregister and delete files. Unknown ids are ignored.
    void RemoveService(const std::string& service_id);

    // Remove every temp service, and every service whose launch was declined,
    // without confirmation.
    void CleanupTempServices();

    [[nodiscard]] std::vector<DynamicService> ListServices() const { return *services_.Get(); }
    [[nodiscard]] std::optional<DynamicService> FindService(const std::string& service_id) const;

    void OnServiceCreated(CreatedListener listener);
    void SetAutoApprove(bool enabled) { auto_approve_ = enabled; }

    [[nodiscard]] bool RuntimeAvailable() const { return runtime_available_; }
    [[nodiscard]] std::optional<std::string> RuntimeVersion() const;

    [[nodiscard]] std::filesystem::path ServicesDir() const;
    [[nodiscard]] std::filesystem::path RuntimePath() const;

private:
    Result<void, Error> ReconnectSavedService(const DynamicService& service);
    ServerConfig BuildServerConfig(const DynamicService& service) const;
    bool ApproveLaunch(const std::string& name, const std::vector<std::string>& tools);
    void UpdateService(const std::string& service_id,
                       const std::function<void(DynamicService&)>& edit);
    void EraseService(const std::string& service_id);
    void DeleteServiceFiles(const DynamicService& service);
    void PersistSavedServices();
    std::string NewServiceId();

    DynamicServiceOptions options_;
    ConnectionRegistry& registry_;
    IKeyValueStore& store_;
    IFileSystem& fs_;
    IConfirmPrompt& prompt_;
    IRuntimeProbe& probe_;

    StateStore<std::vector<DynamicService>> services_;
    std::atomic<bool> auto_approve_;
    std::atomic<bool> runtime_available_{false};

    mutable std::mutex mutex_;   // runtime_version_, listeners_, runtime writes, prompts
    std::optional<std::string> runtime_version_;
    std::vector<CreatedListener> listeners_;
    std::mutex persist_mutex_;
};

} // namespace mcphub

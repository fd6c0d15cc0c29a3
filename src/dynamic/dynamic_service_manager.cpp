#include <mcphub/dynamic/dynamic_service_manager.hpp>

#include <mcphub/core/clock.hpp>
#include <mcphub/core/log.hpp>
#include <mcphub/dynamic/interpreter_probe.hpp>
#include <mcphub/dynamic/runtime_script.hpp>

#include <algorithm>
#include <random>

namespace mcphub {

namespace {

constexpr const char* kStoreFileName = "dynamic-mcp-services.json";
constexpr const char* kSavedServicesKey = "savedServices";
constexpr const char* kServicesDirName = "mcp-services";
constexpr const char* kServerIdPrefix = "ai-svc-";
constexpr const char* kLaunchTitle = "Launch AI-generated service";

Error MakeDynamicError(const std::string& operation, const std::string& target,
                       const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

bool IsDynamicServerId(std::string_view server_id) {
    return server_id.rfind(kServerIdPrefix, 0) == 0;
}

DynamicServiceManager::DynamicServiceManager(DynamicServiceOptions options,
                                             ConnectionRegistry& registry,
                                             IKeyValueStore& store,
                                             IFileSystem& fs,
                                             IConfirmPrompt& prompt,
                                             IRuntimeProbe& probe)
    : options_(std::move(options)),
      registry_(registry),
      store_(store),
      fs_(fs),
      prompt_(prompt),
      probe_(probe),
      auto_approve_(options_.auto_approve) {}

std::filesystem::path DynamicServiceManager::ServicesDir() const {
    return options_.data_dir / kServicesDirName;
}

std::filesystem::path DynamicServiceManager::RuntimePath() const {
    return ServicesDir() / "runtime" / std::string(kRuntimeFileName);
}

std::optional<std::string> DynamicServiceManager::RuntimeVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_version_;
}

std::optional<DynamicService> DynamicServiceManager::FindService(
    const std::string& service_id) const {
    auto snapshot = services_.Get();
    auto it = std::find_if(snapshot->begin(), snapshot->end(),
                           [&](const DynamicService& s) { return s.id == service_id; });
    if (it == snapshot->end()) {
        return std::nullopt;
    }
    return *it;
}

void DynamicServiceManager::OnServiceCreated(CreatedListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------
void DynamicServiceManager::Init() {
    auto version = probe_.Version(options_.interpreter);
    if (version.IsErr()) {
        LogWarn("dynamic", "Dynamic services disabled: " + version.Error().message);
        runtime_available_ = false;
        return;
    }
    auto major = ParseMajorVersion(version.Value());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runtime_version_ = version.Value();
    }
    if (!major.has_value() || *major < options_.min_major_version) {
        LogWarn("dynamic", "Dynamic services disabled: " + options_.interpreter + " " +
                               version.Value() + " is older than required major version " +
                               std::to_string(options_.min_major_version));
        runtime_available_ = false;
        return;
    }
    runtime_available_ = true;

    auto loaded = store_.Load(options_.data_dir / kStoreFileName);
    if (loaded.IsErr()) {
        LogWarn("dynamic", "Could not load saved services: " + loaded.Error().ToString());
        return;
    }
    auto stored = store_.Get(kSavedServicesKey);
    if (!stored.has_value() || !stored->is_array() || stored->empty()) {
        return;
    }

    std::vector<DynamicService> saved;
    for (const auto& entry : *stored) {
        auto service = DynamicServiceFromJson(entry);
        if (service.IsErr()) {
            LogWarn("dynamic", "Skipping saved service: " + service.Error().message);
            continue;
        }
        saved.push_back(std::move(service).Value());
    }
    services_.Update([&](std::vector<DynamicService>& services) {
        for (const auto& service : saved) {
            services.push_back(service);
        }
    });

    // One at a time so any startup prompts are not interleaved; each failure
    // stays on its own service.
    for (const auto& service : saved) {
        auto reconnected = ReconnectSavedService(service);
        if (reconnected.IsErr()) {
            LogError("dynamic", "Failed to reconnect \"" + service.name + "\": " +
                                    reconnected.Error().message);
            auto message = "Reconnect failed: " + reconnected.Error().message;
            UpdateService(service.id, [&](DynamicService& s) {
                s.status = ServiceStatus::Error;
                s.error = message;
            });
        }
    }
}

Result<void, Error> DynamicServiceManager::ReconnectSavedService(const DynamicService& service) {
    auto runtime = EnsureRuntime();
    if (runtime.IsErr()) {
        return Result<void, Error>::Err(std::move(runtime).Error());
    }
    auto definition = std::filesystem::path(service.service_dir) / std::string(kDefinitionFileName);
    if (!fs_.Exists(definition)) {
        return Result<void, Error>::Err(MakeDynamicError(
            "ReconnectSavedService", service.id, "Service files missing",
            ErrorCategory::Persistence));
    }

    if (options_.confirm_saved_on_startup) {
        if (!ApproveLaunch(service.name, service.tools)) {
            return Result<void, Error>::Err(MakeDynamicError(
                "ReconnectSavedService", service.id, "Cancelled by user",
                ErrorCategory::SecurityDecline));
        }
    } else {
        LogInfo("dynamic", "Relaunching saved service \"" + service.name +
                               "\" without confirmation (approved at creation)");
    }

    auto config = BuildServerConfig(service);
    registry_.AddServer(config);
    auto connected = registry_.ConnectServer(config);
    if (connected.IsErr()) {
        return connected;
    }
    UpdateService(service.id, [](DynamicService& s) {
        s.status = ServiceStatus::Running;
        s.error.reset();
    });
    return Result<void, Error>::Ok();
}

Result<std::filesystem::path, Error> DynamicServiceManager::EnsureRuntime() {
    auto path = RuntimePath();
    std::lock_guard<std::mutex> lock(mutex_);
    if (fs_.Exists(path)) {
        return Result<std::filesystem::path, Error>::Ok(path);
    }
    auto created = fs_.CreateDirectories(path.parent_path());
    if (created.IsErr()) {
        return Result<std::filesystem::path, Error>::Err(std::move(created).Error());
    }
    auto written = fs_.WriteFile(path, std::string(RuntimeScript()));
    if (written.IsErr()) {
        return Result<std::filesystem::path, Error>::Err(std::move(written).Error());
    }
    LogInfo("dynamic", "Installed runtime script at " + path.string());
    return Result<std::filesystem::path, Error>::Ok(path);
}

// ---------------------------------------------------------------------------
// Create / save / remove
// ---------------------------------------------------------------------------
Result<DynamicService, Error> DynamicServiceManager::CreateService(
    const CreateServiceParams& params) {
    if (!runtime_available_) {
        return Result<DynamicService, Error>::Err(MakeDynamicError(
            "CreateService", params.name,
            "Dynamic services are unavailable: " + options_.interpreter + " >= " +
                std::to_string(options_.min_major_version) + " is required",
            ErrorCategory::Configuration));
    }
    auto runtime = EnsureRuntime();
    if (runtime.IsErr()) {
        return Result<DynamicService, Error>::Err(std::move(runtime).Error());
    }

    DynamicService service;
    service.id = NewServiceId();
    service.name = params.name;
    service.description = params.description;
    service.status = ServiceStatus::Starting;
    service.lifecycle = params.lifecycle;
    service.mcp_server_id = kServerIdPrefix + service.id;
    service.service_dir =
        (ServicesDir() / ServiceLifecycleName(params.lifecycle) / service.id).string();
    service.created_at = NowEpochMillis();
    for (const auto& tool : params.tools) {
        service.tools.push_back(tool.name);
    }
    service.env = params.env;

    const std::filesystem::path dir = service.service_dir;
    auto created = fs_.CreateDirectories(dir);
    if (created.IsErr()) {
        return Result<DynamicService, Error>::Err(std::move(created).Error());
    }
    auto definition = DefinitionDocument(params.name, params.description, params.tools);
    auto written = fs_.WriteFile(dir / std::string(kDefinitionFileName), definition.dump(2));
    if (written.IsOk()) {
        written = fs_.WriteFile(dir / std::string(kHandlersFileName), params.handlers_code);
    }
    if (written.IsErr()) {
        if (auto removed = fs_.RemoveAll(dir); removed.IsErr()) {
            LogWarn("dynamic", "Could not clean up " + dir.string() + ": " +
                                   removed.Error().message);
        }
        return Result<DynamicService, Error>::Err(std::move(written).Error());
    }

    services_.Update([&](std::vector<DynamicService>& services) { services.push_back(service); });

    // Security gate: nothing is registered or started before approval.
    if (!auto_approve_ && !ApproveLaunch(service.name, service.tools)) {
        LogInfo("dynamic", "Launch of \"" + service.name + "\" declined");
        UpdateService(service.id, [](DynamicService& s) {
            s.status = ServiceStatus::Error;
            s.error = "Cancelled by user";
        });
        return Result<DynamicService, Error>::Err(MakeDynamicError(
            "CreateService", service.name, "Service launch cancelled by user",
            ErrorCategory::SecurityDecline));
    }
    service.launch_approved = true;
    UpdateService(service.id, [](DynamicService& s) { s.launch_approved = true; });

    auto config = BuildServerConfig(service);
    registry_.AddServer(config);
    auto connected = registry_.ConnectServer(config);
    if (connected.IsErr()) {
        auto error = std::move(connected).Error();
        UpdateService(service.id, [&](DynamicService& s) {
            s.status = ServiceStatus::Error;
            s.error = error.message;
        });
        error.operation = "CreateService";
        error.target = service.name;
        error.message = "Service \"" + service.name + "\" failed to start: " + error.message;
        return Result<DynamicService, Error>::Err(std::move(error));
    }

    service.status = ServiceStatus::Running;
    UpdateService(service.id, [](DynamicService& s) { s.status = ServiceStatus::Running; });
    PersistSavedServices();
    LogInfo("dynamic", "Service \"" + service.name + "\" running with tools: " +
                           JoinNames(service.tools));

    std::vector<CreatedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    ServiceCreatedEvent event{service.name, service.tools};
    for (const auto& listener : listeners) {
        listener(event);
    }
    return Result<DynamicService, Error>::Ok(std::move(service));
}

Result<void, Error> DynamicServiceManager::SaveService(const std::string& service_id) {
    auto found = FindService(service_id);
    if (!found.has_value()) {
        return Result<void, Error>::Err(MakeDynamicError(
            "SaveService", service_id, "Service not found: " + service_id,
            ErrorCategory::Configuration));
    }
    if (found->lifecycle == ServiceLifecycle::Saved) {
        return Result<void, Error>::Ok();
    }

    const std::filesystem::path source = found->service_dir;
    const auto target = ServicesDir() / ServiceLifecycleName(ServiceLifecycle::Saved) / found->id;
    auto created = fs_.CreateDirectories(target);
    if (created.IsErr()) {
        return created;
    }
    for (auto file : {kDefinitionFileName, kHandlersFileName}) {
        auto content = fs_.ReadFile(source / std::string(file));
        if (content.IsErr()) {
            return Result<void, Error>::Err(std::move(content).Error());
        }
        auto written = fs_.WriteFile(target / std::string(file), content.Value());
        if (written.IsErr()) {
            return written;
        }
    }

    UpdateService(service_id, [&](DynamicService& s) {
        s.lifecycle = ServiceLifecycle::Saved;
        s.service_dir = target.string();
    });
    if (auto removed = fs_.RemoveAll(source); removed.IsErr()) {
        LogWarn("dynamic", "Could not delete temp files of \"" + found->name + "\": " +
                               removed.Error().message);
    }

    // The running process already loaded its files; the stored config is
    // pointed at the new directory for the next launch.
    auto updated = FindService(service_id);
    if (updated.has_value()) {
        registry_.AddServer(BuildServerConfig(*updated));
    }
    PersistSavedServices();
    LogInfo("dynamic", "Saved service \"" + found->name + "\"");
    return Result<void, Error>::Ok();
}

void DynamicServiceManager::RemoveService(const std::string& service_id) {
    auto found = FindService(service_id);
    if (!found.has_value()) {
        LogDebug("dynamic", "RemoveService: no service " + service_id);
        return;
    }
    registry_.RemoveServer(found->mcp_server_id);
    DeleteServiceFiles(*found);
    EraseService(service_id);
    if (found->lifecycle == ServiceLifecycle::Saved) {
        PersistSavedServices();
    }
    LogInfo("dynamic", "Removed service \"" + found->name + "\"");
}

void DynamicServiceManager::CleanupTempServices() {
    auto snapshot = services_.Get();
    size_t removed = 0;
    for (const auto& service : *snapshot) {
        if (service.lifecycle != ServiceLifecycle::Temp && service.launch_approved) {
            continue;
        }
        registry_.RemoveServer(service.mcp_server_id);
        EraseService(service.id);
        DeleteServiceFiles(service);
        ++removed;
    }
    if (removed > 0) {
        LogInfo("dynamic", "Cleaned up " + std::to_string(removed) + " temp service(s)");
    }
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
ServerConfig DynamicServiceManager::BuildServerConfig(const DynamicService& service) const {
    ServerConfig config;
    config.id = service.mcp_server_id;
    config.name = "[AI] " + service.name;
    config.description = service.description;
    config.transport = StdioTransportConfig{
        options_.interpreter,
        {RuntimePath().string(), "--dir", service.service_dir},
        service.env.value_or(EnvMap{}),
    };
    config.enabled = true;
    return config;
}

bool DynamicServiceManager::ApproveLaunch(const std::string& name,
                                          const std::vector<std::string>& tools) {
    auto message = "Service \"" + name + "\" will run generated code and expose the tools: " +
                   JoinNames(tools) + ". Allow it to start?";
    std::lock_guard<std::mutex> lock(mutex_);
    return prompt_.Confirm(kLaunchTitle, message);
}

void DynamicServiceManager::UpdateService(const std::string& service_id,
                                          const std::function<void(DynamicService&)>& edit) {
    services_.Update([&](std::vector<DynamicService>& services) {
        for (auto& service : services) {
            if (service.id == service_id) {
                edit(service);
            }
        }
    });
}

void DynamicServiceManager::EraseService(const std::string& service_id) {
    services_.Update([&](std::vector<DynamicService>& services) {
        services.erase(std::remove_if(services.begin(), services.end(),
                                      [&](const DynamicService& s) { return s.id == service_id; }),
                       services.end());
    });
}

void DynamicServiceManager::DeleteServiceFiles(const DynamicService& service) {
    auto removed = fs_.RemoveAll(service.service_dir);
    if (removed.IsErr()) {
        LogWarn("dynamic", "Could not delete files of \"" + service.name + "\": " +
                               removed.Error().message);
    }
}

void DynamicServiceManager::PersistSavedServices() {
    auto snapshot = services_.Get();
    auto saved = nlohmann::json::array();
    for (const auto& service : *snapshot) {
        if (service.lifecycle == ServiceLifecycle::Saved && service.launch_approved) {
            saved.push_back(DynamicServiceToJson(service));
        }
    }

    std::lock_guard<std::mutex> lock(persist_mutex_);
    store_.Set(kSavedServicesKey, std::move(saved));
    auto written = store_.Save();
    if (written.IsErr()) {
        LogWarn("dynamic", "Failed to persist saved services: " + written.Error().ToString());
    }
}

std::string DynamicServiceManager::NewServiceId() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    std::string suffix;
    for (int i = 0; i < 6; ++i) {
        suffix += kAlphabet[pick(rng)];
    }
    return "dyn-" + std::to_string(NowEpochMillis()) + "-" + suffix;
}

} // namespace mcphub

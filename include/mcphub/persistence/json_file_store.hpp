#pragma once

#include <mcphub/persistence/i_key_value_store.hpp>

#include <filesystem>
#include <mutex>

namespace mcphub {

// ---------------------------------------------------------------------------
// JsonFileStore: IKeyValueStore persisted as a pretty-printed JSON object.
//
// Saves go through a sibling temp file and a rename, so a crash mid-write
// leaves the previous document intact.
// ---------------------------------------------------------------------------
class JsonFileStore : public IKeyValueStore {
public:
    JsonFileStore() = default;

    Result<void, Error> Load(const std::filesystem::path& file) override;
    [[nodiscard]] std::optional<nlohmann::json> Get(const std::string& key) const override;
    void Set(const std::string& key, nlohmann::json value) override;
    Result<void, Error> Save() override;

    [[nodiscard]] std::filesystem::path File() const;

private:
    mutable std::mutex mutex_;
    std::filesystem::path file_;
    nlohmann::json document_ = nlohmann::json::object();
};

} // namespace mcphub

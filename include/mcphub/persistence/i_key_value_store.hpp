#pragma once

#include <mcphub/core/result.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// IKeyValueStore: one JSON document of top-level keys backed by a file.
//
// Load() binds the store to a file and reads it; Set() changes memory only;
// Save() writes the whole document back.
// ---------------------------------------------------------------------------
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    // A missing file is not an error: the store starts empty.
    virtual Result<void, Error> Load(const std::filesystem::path& file) = 0;

    [[nodiscard]] virtual std::optional<nlohmann::json> Get(const std::string& key) const = 0;

    virtual void Set(const std::string& key, nlohmann::json value) = 0;

    virtual Result<void, Error> Save() = 0;

    IKeyValueStore(const IKeyValueStore&) = delete;
    IKeyValueStore& operator=(const IKeyValueStore&) = delete;
    IKeyValueStore(IKeyValueStore&&) = delete;
    IKeyValueStore& operator=(IKeyValueStore&&) = delete;

protected:
    IKeyValueStore() = default;
};

} // namespace mcphub

#include <mcphub/persistence/json_file_store.hpp>

#include <mcphub/core/log.hpp>

#include <fstream>
#include <system_error>

namespace mcphub {

namespace fs = std::filesystem;

namespace {

Error MakeStoreError(const std::string& operation, const fs::path& file,
                     const std::string& message) {
    return Error{operation, file.string(), std::nullopt, message, std::nullopt,
                 ErrorCategory::Persistence};
}

} // anonymous namespace

Result<void, Error> JsonFileStore::Load(const fs::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ = file;
    document_ = nlohmann::json::object();

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        LogDebug("store", "No document at " + file.string() + ", starting empty");
        return Result<void, Error>::Ok();
    }

    std::ifstream ifs(file);
    if (!ifs) {
        return Result<void, Error>::Err(
            MakeStoreError("StoreLoad", file, "Cannot open file for reading"));
    }
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return Result<void, Error>::Err(
            MakeStoreError("StoreLoad", file, std::string("Malformed JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return Result<void, Error>::Err(
            MakeStoreError("StoreLoad", file, "Document root is not an object"));
    }
    document_ = std::move(j);
    LogDebug("store", "Loaded " + file.string());
    return Result<void, Error>::Ok();
}

std::optional<nlohmann::json> JsonFileStore::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.find(key);
    if (it == document_.end()) {
        return std::nullopt;
    }
    return *it;
}

void JsonFileStore::Set(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    document_[key] = std::move(value);
}

Result<void, Error> JsonFileStore::Save() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.empty()) {
        return Result<void, Error>::Err(
            MakeStoreError("StoreSave", file_, "Store was never loaded from a file"));
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::Err(MakeStoreError(
                "StoreSave", file_, "Cannot create directory: " + ec.message()));
        }
    }

    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            return Result<void, Error>::Err(
                MakeStoreError("StoreSave", file_, "Cannot open file for writing"));
        }
        ofs << document_.dump(2) << '\n';
        if (!ofs) {
            return Result<void, Error>::Err(
                MakeStoreError("StoreSave", file_, "Write failed"));
        }
    }
    fs::rename(tmp, file_, ec);
    if (ec) {
        auto message = "Cannot replace file: " + ec.message();
        fs::remove(tmp, ec);
        return Result<void, Error>::Err(MakeStoreError("StoreSave", file_, message));
    }
    return Result<void, Error>::Ok();
}

fs::path JsonFileStore::File() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_;
}

} // namespace mcphub

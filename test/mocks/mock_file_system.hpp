#pragma once

#include <mcphub/dynamic/i_file_system.hpp>

#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcphub {
namespace testing {

// ---------------------------------------------------------------------------
// MockFileSystem: files and directories kept in maps keyed by generic path
// string. RemoveAll drops the path and everything below it.
// ---------------------------------------------------------------------------
class MockFileSystem : public IFileSystem {
public:
    Result<void, Error> CreateDirectories(const std::filesystem::path& dir) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) {
            return Result<void, Error>::Err(WriteError(dir));
        }
        for (auto p = dir; !p.empty() && p != p.parent_path(); p = p.parent_path()) {
            dirs_.insert(p.generic_string());
        }
        return Result<void, Error>::Ok();
    }

    Result<void, Error> WriteFile(const std::filesystem::path& file,
                                  const std::string& content) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) {
            return Result<void, Error>::Err(WriteError(file));
        }
        files_[file.generic_string()] = content;
        return Result<void, Error>::Ok();
    }

    Result<std::string, Error> ReadFile(const std::filesystem::path& file) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(file.generic_string());
        if (it == files_.end()) {
            return Result<std::string, Error>::Err(
                Error{"ReadFile", file.string(), std::nullopt, "No such file",
                      std::nullopt, ErrorCategory::Persistence});
        }
        return Result<std::string, Error>::Ok(it->second);
    }

    [[nodiscard]] bool Exists(const std::filesystem::path& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = path.generic_string();
        return files_.count(key) > 0 || dirs_.count(key) > 0;
    }

    Result<void, Error> RemoveAll(const std::filesystem::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = path.generic_string();
        removed_.push_back(key);
        auto below = [&key](const std::string& candidate) {
            return candidate == key || candidate.rfind(key + "/", 0) == 0;
        };
        for (auto it = files_.begin(); it != files_.end();) {
            it = below(it->first) ? files_.erase(it) : std::next(it);
        }
        for (auto it = dirs_.begin(); it != dirs_.end();) {
            it = below(*it) ? dirs_.erase(it) : std::next(it);
        }
        return Result<void, Error>::Ok();
    }

    // -- Scripting and inspection -------------------------------------------------

    void AddFile(const std::filesystem::path& file, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[file.generic_string()] = content;
    }

    void SetFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    std::optional<std::string> Content(const std::filesystem::path& file) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(file.generic_string());
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> Removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

private:
    static Error WriteError(const std::filesystem::path& path) {
        return Error{"WriteFile", path.string(), std::nullopt, "Disk full",
                     std::nullopt, ErrorCategory::Persistence};
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
    std::vector<std::string> removed_;
    bool fail_writes_ = false;
};

} // namespace testing
} // namespace mcphub

#pragma once

#include <mcphub/core/result.hpp>

#include <filesystem>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// IFileSystem: the few file primitives the dynamic service manager needs.
// ---------------------------------------------------------------------------
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // mkdir -p
    virtual Result<void, Error> CreateDirectories(const std::filesystem::path& dir) = 0;
    virtual Result<void, Error> WriteFile(const std::filesystem::path& file,
                                          const std::string& content) = 0;
    virtual Result<std::string, Error> ReadFile(const std::filesystem::path& file) = 0;
    [[nodiscard]] virtual bool Exists(const std::filesystem::path& path) const = 0;
    // rm -r; a missing path is not an error.
    virtual Result<void, Error> RemoveAll(const std::filesystem::path& path) = 0;

    IFileSystem(const IFileSystem&) = delete;
    IFileSystem& operator=(const IFileSystem&) = delete;
    IFileSystem(IFileSystem&&) = delete;
    IFileSystem& operator=(IFileSystem&&) = delete;

protected:
    IFileSystem() = default;
};

} // namespace mcphub

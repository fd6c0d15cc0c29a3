#pragma once

#include <mcphub/dynamic/i_file_system.hpp>

namespace mcphub {

// IFileSystem over std::filesystem and fstreams.
class LocalFileSystem : public IFileSystem {
public:
    LocalFileSystem() = default;

    Result<void, Error> CreateDirectories(const std::filesystem::path& dir) override;
    Result<void, Error> WriteFile(const std::filesystem::path& file,
                                  const std::string& content) override;
    Result<std::string, Error> ReadFile(const std::filesystem::path& file) override;
    [[nodiscard]] bool Exists(const std::filesystem::path& path) const override;
    Result<void, Error> RemoveAll(const std::filesystem::path& path) override;
};

} // namespace mcphub

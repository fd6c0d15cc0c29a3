#include <mcphub/dynamic/local_file_system.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace mcphub {

namespace {

Error MakeFsError(const std::string& operation, const std::filesystem::path& path,
                  const std::string& message) {
    return Error{operation, path.string(), std::nullopt, message, std::nullopt,
                 ErrorCategory::Persistence};
}

} // anonymous namespace

Result<void, Error> LocalFileSystem::CreateDirectories(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result<void, Error>::Err(
            MakeFsError("CreateDirectories", dir, "Cannot create directory: " + ec.message()));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> LocalFileSystem::WriteFile(const std::filesystem::path& file,
                                               const std::string& content) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(
            MakeFsError("WriteFile", file, "Cannot open file for writing"));
    }
    out << content;
    out.close();
    if (!out) {
        return Result<void, Error>::Err(MakeFsError("WriteFile", file, "Write failed"));
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> LocalFileSystem::ReadFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(
            MakeFsError("ReadFile", file, "Cannot open file for reading"));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return Result<std::string, Error>::Ok(buffer.str());
}

bool LocalFileSystem::Exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

Result<void, Error> LocalFileSystem::RemoveAll(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Result<void, Error>::Err(
            MakeFsError("RemoveAll", path, "Cannot remove: " + ec.message()));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcphub

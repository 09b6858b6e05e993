#include <relcheck/core/file_utils.h>

#include <fstream>
#include <sstream>

namespace relcheck {

Result<std::string> readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "Cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Result<void> writeFileAtomic(const std::filesystem::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "Cannot create directory " +
                                                    path.parent_path().string() + ": " +
                                                    ec.message()};
        }
    }

    auto tempPath = path;
    tempPath += ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return Error{ErrorCode::WriteError, "Cannot open " + tempPath.string()};
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return Error{ErrorCode::WriteError,
                     "Cannot move " + tempPath.string() + " into place: " + ec.message()};
    }
    return Result<void>();
}

} // namespace relcheck

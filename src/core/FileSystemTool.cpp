#include "FileSystemTool.hpp"
#include <system_error>

namespace LazyWebp
{
    bool FileSystemTool::isImageFile(const fs::path& path) {
        std::string ext = path.extension().string();
        if (ext.size() < 2) return false;
        ext = to_lower(ext.substr(1));
        return std::find(SUPPORTED_IMG_FORMATS.begin(), SUPPORTED_IMG_FORMATS.end(), ext)
            != SUPPORTED_IMG_FORMATS.end();
    }

    bool FileSystemTool::isTemporaryArtifact(const fs::path& path) {
        return path.filename().string().rfind(TEMP_FILE_PREFIX, 0) == 0;
    }

    fs::path FileSystemTool::toAbsolutePath(const fs::path& path) {
        std::error_code ec;
        fs::path abs = fs::absolute(path, ec);
        return ec ? path : abs.lexically_normal();
    }

    fs::path FileSystemTool::resolvePath(const fs::path& path) {
        std::error_code ec;
        fs::path resolved = fs::weakly_canonical(path, ec);
        if (ec) {
            return toAbsolutePath(path);
        }
        return resolved;
    }

    bool FileSystemTool::isSameFile(const fs::path& a, const fs::path& b) {
        return resolvePath(a) == resolvePath(b);
    }

    fs::path FileSystemTool::webpPathFor(const fs::path& inputPath, const fs::path& directory) {
        return directory / (inputPath.stem().string() + OUTPUT_EXTENSION);
    }

    void FileSystemTool::createDirectory(const fs::path& dirpath) {
        if (dirpath.empty() || fs::is_directory(dirpath)) return;
        std::error_code ec;
        fs::create_directories(dirpath, ec);
        // Another worker may have created it in the meantime
        if (ec && !fs::is_directory(dirpath)) {
            throw fs::filesystem_error("Could not create directory", dirpath, ec);
        }
    }

    void FileSystemTool::createDirectoryForFile(const fs::path& filepath) {
        if (filepath.has_parent_path()) {
            createDirectory(filepath.parent_path());
        }
    }

    std::vector<fs::path> FileSystemTool::getImageFiles(const fs::path& directory, bool recursive) {
        std::vector<fs::path> files;

        auto consider = [&](const fs::directory_entry& entry) {
            std::error_code ec;
            if (!entry.is_regular_file(ec) || ec) return;
            const fs::path& p = entry.path();
            if (isTemporaryArtifact(p) || !isImageFile(p)) return;
            files.push_back(p);
        };

        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(directory)) consider(entry);
        } else {
            for (const auto& entry : fs::directory_iterator(directory)) consider(entry);
        }
        return files;
    }

    std::uintmax_t FileSystemTool::directorySize(const fs::path& directory) {
        std::uintmax_t total = 0;
        std::error_code ec;
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) return 0;

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code statEc;
            if (it->is_regular_file(statEc)) {
                std::uintmax_t size = it->file_size(statEc);
                if (!statEc) total += size;
            }
        }
        return total;
    }

    std::optional<std::uintmax_t> FileSystemTool::availableSpace(const fs::path& path) {
        std::error_code ec;
        fs::space_info info = fs::space(path, ec);
        if (ec) return std::nullopt;
        return info.available;
    }

    bool FileSystemTool::removeQuietly(const fs::path& path) noexcept {
        std::error_code ec;
        return fs::remove(path, ec) && !ec;
    }

} // namespace LazyWebp

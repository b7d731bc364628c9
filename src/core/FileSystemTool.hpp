#pragma once

#include "Common.h"
#include <cstdint>
#include <optional>

namespace LazyWebp
{
    /**
     * @brief Filesystem helpers used by discovery, preflight and conversion.
     */
    class FileSystemTool {
    public:
        // --- Path Classifier ---

        /**
         * @brief True when the path's extension (case-insensitive) is one of
         * SUPPORTED_IMG_FORMATS. Pure function of the name, no I/O.
         */
        static bool isImageFile(const fs::path& path);

        /**
         * @brief True for the converter's own hidden temp files.
         */
        static bool isTemporaryArtifact(const fs::path& path);

        // --- Path Normalization ---

        static fs::path toAbsolutePath(const fs::path& path);

        /**
         * @brief Absolute path with symlinks resolved for the parts that exist.
         */
        static fs::path resolvePath(const fs::path& path);

        static bool isSameFile(const fs::path& a, const fs::path& b);

        /**
         * @brief `<dir>/<stem>.webp`
         */
        static fs::path webpPathFor(const fs::path& inputPath, const fs::path& directory);

        // --- Directory Creation ---

        /**
         * @brief Creates a directory tree if missing.
         * @throws std::filesystem::filesystem_error if it cannot be created.
         */
        static void createDirectory(const fs::path& dirpath);

        static void createDirectoryForFile(const fs::path& filepath);

        // --- File Searching ---

        /**
         * @brief Regular files under directory that are eligible images,
         * in directory-listing order. Temp artifacts are never returned.
         * @throws std::filesystem::filesystem_error on listing failure.
         */
        static std::vector<fs::path> getImageFiles(const fs::path& directory, bool recursive = false);

        // --- Space Accounting ---

        /**
         * @brief Sum of regular file sizes below directory (recursive).
         * Entries that cannot be stat'ed count as zero.
         */
        static std::uintmax_t directorySize(const fs::path& directory);

        /**
         * @brief Bytes available to an unprivileged writer on the filesystem
         * holding path, or nullopt when the query fails.
         */
        static std::optional<std::uintmax_t> availableSpace(const fs::path& path);

        // --- Deletion ---

        /**
         * @brief Removes a single file, ignoring every error. Returns true if
         * something was removed.
         */
        static bool removeQuietly(const fs::path& path) noexcept;
    };

} // namespace LazyWebp

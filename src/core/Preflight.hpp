#pragma once

#include "Common.h"
#include <cstdint>
#include <functional>
#include <optional>

namespace LazyWebp
{
    /**
     * @brief Access and disk-headroom checks run before a
     * directory-to-directory conversion.
     */
    class Preflight {
    public:
        /**
         * @brief Validates inputDir (directory, readable), creates outputDir if
         * needed (must be writable) and checks that the output filesystem has
         * DISK_SPACE_HEADROOM times the input directory size available.
         *
         * @throws ConversionError (AccessDenied, InsufficientDiskSpace)
         */
        static void validateDirectories(const fs::path& inputDir, const fs::path& outputDir);

        // Free bytes on the filesystem holding a path, nullopt if unknown
        using SpaceQuery = std::function<std::optional<std::uintmax_t>(const fs::path&)>;

        static void validateDirectories(const fs::path& inputDir, const fs::path& outputDir,
                                        const SpaceQuery& availableSpace);

        static bool hasSufficientSpace(std::uintmax_t requiredBytes, std::uintmax_t availableBytes);

    private:
        static bool isReadable(const fs::path& path);
        static bool isWritable(const fs::path& path);
    };

} // namespace LazyWebp

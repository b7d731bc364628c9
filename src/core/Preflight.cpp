#include "Preflight.hpp"
#include "FileSystemTool.hpp"
#include "../utils/Console.hpp"
#include <system_error>
#include <unistd.h>

namespace LazyWebp
{
    bool Preflight::isReadable(const fs::path& path) {
        return ::access(path.c_str(), R_OK) == 0;
    }

    bool Preflight::isWritable(const fs::path& path) {
        return ::access(path.c_str(), W_OK) == 0;
    }

    bool Preflight::hasSufficientSpace(std::uintmax_t requiredBytes, std::uintmax_t availableBytes) {
        return static_cast<long double>(availableBytes)
            >= static_cast<long double>(requiredBytes) * DISK_SPACE_HEADROOM;
    }

    void Preflight::validateDirectories(const fs::path& inputDir, const fs::path& outputDir) {
        validateDirectories(inputDir, outputDir, &FileSystemTool::availableSpace);
    }

    void Preflight::validateDirectories(const fs::path& inputDir, const fs::path& outputDir,
                                        const SpaceQuery& availableSpace) {
        std::error_code ec;
        if (!fs::is_directory(inputDir, ec)) {
            throw ConversionError(ErrorKind::AccessDenied, "Input path is not a directory: " + inputDir.string());
        }
        if (!isReadable(inputDir)) {
            throw ConversionError(ErrorKind::AccessDenied, "Input directory is not readable: " + inputDir.string());
        }

        try {
            FileSystemTool::createDirectory(outputDir);
        } catch (const fs::filesystem_error& e) {
            throw ConversionError(ErrorKind::AccessDenied,
                "Could not create output directory '" + outputDir.string() + "': " + e.what());
        }
        if (!isWritable(outputDir)) {
            throw ConversionError(ErrorKind::AccessDenied, "Output directory is not writable: " + outputDir.string());
        }

        const std::uintmax_t required = FileSystemTool::directorySize(inputDir);
        const auto available = availableSpace(outputDir);
        if (!available) {
            Console::warning("could not check disk space for " + outputDir.string());
            return;
        }

        if (!hasSufficientSpace(required, *available)) {
            throw ConversionError(ErrorKind::InsufficientDiskSpace,
                "Insufficient disk space: " + std::to_string(*available) + " bytes available, "
                + std::to_string(required) + " bytes of input");
        }
    }

} // namespace LazyWebp

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for lazywebp.
 */
namespace LazyWebp
{
    // Input extensions accepted for conversion (lowercase, no dot)
    const std::vector<std::string> SUPPORTED_IMG_FORMATS = {
        "jpg", "jpeg", "png", "gif", "bmp", "tiff", "webp"
    };

    const std::string OUTPUT_EXTENSION = ".webp";

    // Hidden prefix of the converter's private temp files
    const std::string TEMP_FILE_PREFIX = ".lazywebp-";

    constexpr int DEFAULT_QUALITY = 90;
    constexpr int WEBP_EFFORT = 6;
    constexpr int WEBP_ALPHA_QUALITY = 100;

    // Output filesystem must offer this multiple of the input size
    constexpr double DISK_SPACE_HEADROOM = 1.2;

    /**
     * @brief Categories of failures raised by the conversion engine.
     *
     * The first four abort a run; the rest are recorded per file.
     */
    enum class ErrorKind {
        InvalidInputKind,
        NoImagesFound,
        InsufficientDiskSpace,
        AccessDenied,
        Codec,
        EmptyOutput,
        RefusedSymlinkOverwrite,
        Filesystem,
        Cancelled
    };

    /**
     * @brief Human readable name of an error kind.
     */
    inline const char* toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidInputKind:        return "InvalidInputKind";
            case ErrorKind::NoImagesFound:           return "NoImagesFound";
            case ErrorKind::InsufficientDiskSpace:   return "InsufficientDiskSpace";
            case ErrorKind::AccessDenied:            return "AccessDenied";
            case ErrorKind::Codec:                   return "Codec";
            case ErrorKind::EmptyOutput:             return "EmptyOutput";
            case ErrorKind::RefusedSymlinkOverwrite: return "RefusedSymlinkOverwrite";
            case ErrorKind::Filesystem:              return "Filesystem";
            case ErrorKind::Cancelled:               return "Cancelled";
        }
        return "Unknown";
    }

    /**
     * @brief Exception carrying one of the engine's error kinds.
     */
    class ConversionError : public std::runtime_error {
    public:
        ConversionError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const { return m_kind; }

        bool isRunFatal() const {
            return m_kind == ErrorKind::InvalidInputKind
                || m_kind == ErrorKind::NoImagesFound
                || m_kind == ErrorKind::InsufficientDiskSpace
                || m_kind == ErrorKind::AccessDenied;
        }

    private:
        ErrorKind m_kind;
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

} // namespace LazyWebp

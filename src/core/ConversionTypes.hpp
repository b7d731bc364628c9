#pragma once

#include "Common.h"
#include <cstdint>
#include <optional>

namespace LazyWebp
{
    /**
     * @brief One input -> output conversion unit.
     */
    struct ConversionTask {
        fs::path inputPath;
        fs::path outputPath;
    };

    /**
     * @brief Per-run settings. Values are clamped, never rejected.
     */
    struct ConversionConfig {
        int quality = DEFAULT_QUALITY;
        int maxConcurrency = 1;

        /**
         * @brief Builds a config with quality clamped to [1, 100] and
         * concurrency clamped to >= 1 (default: clamp(cpus - 1, 1, 4)).
         */
        static ConversionConfig make(int quality = DEFAULT_QUALITY,
                                     std::optional<int> maxConcurrency = std::nullopt);

        static int defaultConcurrency();
    };

    /**
     * @brief Terminal state of one task.
     */
    struct FileConversionOutcome {
        bool success = false;
        bool skipped = false;
        std::string error;
        std::optional<ErrorKind> errorKind;
        std::uintmax_t inputBytes = 0;
        std::uintmax_t outputBytes = 0;

        static FileConversionOutcome converted(std::uintmax_t in, std::uintmax_t out) {
            FileConversionOutcome o;
            o.success = true;
            o.inputBytes = in;
            o.outputBytes = out;
            return o;
        }

        static FileConversionOutcome skip() {
            FileConversionOutcome o;
            o.success = true;
            o.skipped = true;
            return o;
        }

        static FileConversionOutcome failure(const std::string& message, std::optional<ErrorKind> kind) {
            FileConversionOutcome o;
            o.error = message;
            o.errorKind = kind;
            return o;
        }
    };

} // namespace LazyWebp

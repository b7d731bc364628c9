#pragma once

#include "RunStatistics.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>

namespace LazyWebp
{
    /**
     * @brief Immutable report of a finished run.
     */
    struct ConversionResult {
        std::size_t totalFiles = 0;
        std::size_t processed = 0;
        std::size_t skipped = 0;
        std::vector<FailedFile> failed;
        std::string duration;
        std::string totalSize;
        std::string savedSize;
        std::string compressionRatio;

        // Raw values behind the formatted fields
        std::int64_t totalInputBytes = 0;
        std::int64_t savedBytes = 0;
        std::int64_t durationMs = 0;
        bool cancelled = false;

        bool hasFailures() const { return !failed.empty(); }
    };

    class ResultAggregator {
    public:
        static ConversionResult finalize(const StatisticsSnapshot& stats, bool cancelled = false);

        /**
         * @brief "512 B", "1.50 KB", "-2.00 MB"; units up to GB.
         */
        static std::string formatBytes(std::int64_t bytes);

        /**
         * @brief "<m>m <s>s", minutes omitted when zero.
         */
        static std::string formatDuration(std::int64_t milliseconds);

        /**
         * @brief saved / total * 100 with two decimals, "0%" for total == 0.
         */
        static std::string formatRatio(std::int64_t savedBytes, std::int64_t totalBytes);

        static nlohmann::json toJson(const ConversionResult& result);
    };

} // namespace LazyWebp

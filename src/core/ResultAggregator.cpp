#include "ResultAggregator.hpp"
#include <iomanip>
#include <sstream>

namespace LazyWebp
{
    std::string ResultAggregator::formatBytes(std::int64_t bytes) {
        static const char* units[] = {"B", "KB", "MB", "GB"};
        const bool negative = bytes < 0;
        double size = negative ? -static_cast<double>(bytes) : static_cast<double>(bytes);
        int unit = 0;

        while (size >= 1024.0 && unit < 3) {
            size /= 1024.0;
            ++unit;
        }

        std::stringstream ss;
        if (negative) ss << "-";
        if (unit == 0) {
            ss << static_cast<std::int64_t>(size) << " " << units[unit];
        } else {
            ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
        }
        return ss.str();
    }

    std::string ResultAggregator::formatDuration(std::int64_t milliseconds) {
        const std::int64_t seconds = std::max<std::int64_t>(milliseconds, 0) / 1000;
        const std::int64_t minutes = seconds / 60;
        if (minutes > 0) {
            return std::to_string(minutes) + "m " + std::to_string(seconds % 60) + "s";
        }
        return std::to_string(seconds) + "s";
    }

    std::string ResultAggregator::formatRatio(std::int64_t savedBytes, std::int64_t totalBytes) {
        if (totalBytes == 0) return "0%";
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2)
           << (static_cast<double>(savedBytes) / static_cast<double>(totalBytes)) * 100.0 << "%";
        return ss.str();
    }

    ConversionResult ResultAggregator::finalize(const StatisticsSnapshot& stats, bool cancelled) {
        ConversionResult result;
        result.totalFiles = stats.totalFiles;
        result.processed = stats.processed;
        result.skipped = stats.skipped;
        result.failed = stats.failed;
        result.totalInputBytes = stats.totalInputBytes;
        result.savedBytes = stats.savedBytes;
        result.cancelled = cancelled;

        if (stats.startTime && stats.endTime) {
            result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                *stats.endTime - *stats.startTime).count();
        }

        result.duration = formatDuration(result.durationMs);
        result.totalSize = formatBytes(stats.totalInputBytes);
        result.savedSize = formatBytes(stats.savedBytes);
        result.compressionRatio = formatRatio(stats.savedBytes, stats.totalInputBytes);
        return result;
    }

    nlohmann::json ResultAggregator::toJson(const ConversionResult& result) {
        nlohmann::json failed = nlohmann::json::array();
        for (const auto& f : result.failed) {
            failed.push_back({{"file", f.file}, {"error", f.error}});
        }

        return {
            {"totalFiles", result.totalFiles},
            {"processed", result.processed},
            {"skipped", result.skipped},
            {"failed", failed},
            {"duration", result.duration},
            {"durationMs", result.durationMs},
            {"totalSize", result.totalSize},
            {"totalInputBytes", result.totalInputBytes},
            {"savedSize", result.savedSize},
            {"savedBytes", result.savedBytes},
            {"compressionRatio", result.compressionRatio},
            {"cancelled", result.cancelled}
        };
    }

} // namespace LazyWebp

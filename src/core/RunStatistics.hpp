#pragma once

#include "Common.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace LazyWebp
{
    struct FailedFile {
        std::string file;
        std::string error;
    };

    /**
     * @brief Plain copy of the counters at one point in time.
     */
    struct StatisticsSnapshot {
        std::size_t processed = 0;
        std::size_t skipped = 0;
        std::vector<FailedFile> failed;
        std::size_t totalFiles = 0;
        std::int64_t totalInputBytes = 0;
        std::int64_t savedBytes = 0;
        std::optional<std::chrono::steady_clock::time_point> startTime;
        std::optional<std::chrono::steady_clock::time_point> endTime;
    };

    /**
     * @brief Counters shared by every conversion of one run.
     *
     * All mutators take the same mutex; conversions running on different
     * threads may call them concurrently.
     */
    class RunStatistics {
    public:
        void start();
        void finish();

        // A task entered the run (scheduled or skipped during discovery)
        void addDiscovered();

        // Advisory skip during discovery: counts toward totalFiles and skipped
        void addSkippedDiscovery();

        void recordSkipped();
        void recordProcessed(std::uintmax_t inputBytes, std::uintmax_t outputBytes);
        void recordFailed(const std::string& file, const std::string& error);

        std::size_t totalFiles() const;
        std::int64_t savedBytes() const;

        StatisticsSnapshot snapshot() const;

    private:
        mutable std::mutex m_mutex;
        StatisticsSnapshot m_data;
    };

} // namespace LazyWebp

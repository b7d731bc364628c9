#include "RunStatistics.hpp"

namespace LazyWebp
{
    void RunStatistics::start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data = StatisticsSnapshot{};
        m_data.startTime = std::chrono::steady_clock::now();
    }

    void RunStatistics::finish() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.endTime = std::chrono::steady_clock::now();
    }

    void RunStatistics::addDiscovered() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_data.totalFiles;
    }

    void RunStatistics::addSkippedDiscovery() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_data.totalFiles;
        ++m_data.skipped;
    }

    void RunStatistics::recordSkipped() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_data.skipped;
    }

    void RunStatistics::recordProcessed(std::uintmax_t inputBytes, std::uintmax_t outputBytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_data.processed;
        m_data.totalInputBytes += static_cast<std::int64_t>(inputBytes);
        m_data.savedBytes += static_cast<std::int64_t>(inputBytes) - static_cast<std::int64_t>(outputBytes);
    }

    void RunStatistics::recordFailed(const std::string& file, const std::string& error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.failed.push_back({file, error});
    }

    std::size_t RunStatistics::totalFiles() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data.totalFiles;
    }

    std::int64_t RunStatistics::savedBytes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data.savedBytes;
    }

    StatisticsSnapshot RunStatistics::snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data;
    }

} // namespace LazyWebp

#pragma once

#include "ConversionTypes.hpp"
#include "RunStatistics.hpp"
#include <optional>

namespace LazyWebp
{
    /**
     * @brief Turns top-level inputs (files and directories) into the ordered
     * task list, counting advisory skips into the run's statistics.
     */
    class TaskDiscovery {
    public:
        explicit TaskDiscovery(RunStatistics& stats);

        /**
         * @throws ConversionError InvalidInputKind, AccessDenied,
         *         InsufficientDiskSpace, NoImagesFound
         */
        std::vector<ConversionTask> discover(const std::vector<fs::path>& inputs,
                                             const std::optional<fs::path>& outputDir,
                                             bool recursive);

    private:
        void collectFile(const fs::path& inputPath,
                         const std::optional<fs::path>& outputDir,
                         std::vector<ConversionTask>& tasks);

        void collectDirectory(const fs::path& inputDir,
                              const std::optional<fs::path>& outputDir,
                              bool recursive,
                              std::vector<ConversionTask>& tasks);

        // Appends the task unless input and output resolve to the same file
        void addTask(const fs::path& inputPath, const fs::path& outputPath,
                     std::vector<ConversionTask>& tasks);

        RunStatistics& m_stats;
    };

} // namespace LazyWebp

#pragma once

#include "AtomicConverter.hpp"
#include "ConversionTypes.hpp"
#include "RunStatistics.hpp"
#include <atomic>

namespace LazyWebp
{
    /**
     * @brief Running totals reported after every wave.
     */
    struct BatchProgress {
        std::size_t completed = 0;
        std::size_t total = 0;
        std::int64_t savedBytes = 0;

        double fraction() const {
            return total == 0 ? 1.0 : static_cast<double>(completed) / static_cast<double>(total);
        }
    };

    /**
     * @brief Receives per-file and per-wave notifications from a run.
     *
     * Both callbacks are invoked on the thread that called runBatch(), after
     * the wave barrier, so implementations need no locking.
     */
    class ConversionObserver {
    public:
        virtual ~ConversionObserver() = default;

        virtual void onFileFinished(const ConversionTask& task, const FileConversionOutcome& outcome) {
            (void)task;
            (void)outcome;
        }

        virtual void onWaveCompleted(const BatchProgress& progress) {
            (void)progress;
        }
    };

    /**
     * @brief Runs tasks in consecutive waves of config.maxConcurrency.
     *
     * Every task of a wave is launched on its own thread and wave N+1 starts
     * only after every task of wave N reached a terminal state.
     */
    class BatchScheduler {
    public:
        BatchScheduler(AtomicConverter& converter,
                       RunStatistics& stats,
                       const ConversionConfig& config,
                       const std::atomic<bool>* cancelled = nullptr,
                       ConversionObserver* observer = nullptr);

        void runBatch(const std::vector<ConversionTask>& tasks);

    private:
        // Records every task from index `from` on as cancelled
        void cancelRemaining(const std::vector<ConversionTask>& tasks, std::size_t from);

        void notifyFile(const ConversionTask& task, const FileConversionOutcome& outcome);

        AtomicConverter& m_converter;
        RunStatistics& m_stats;
        ConversionConfig m_config;
        const std::atomic<bool>* m_cancelled;
        ConversionObserver* m_observer;
    };

} // namespace LazyWebp

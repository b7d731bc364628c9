#include "BatchScheduler.hpp"
#include <future>
#include <system_error>

namespace LazyWebp
{
    BatchScheduler::BatchScheduler(AtomicConverter& converter,
                                   RunStatistics& stats,
                                   const ConversionConfig& config,
                                   const std::atomic<bool>* cancelled,
                                   ConversionObserver* observer)
        : m_converter(converter),
          m_stats(stats),
          m_config(config),
          m_cancelled(cancelled),
          m_observer(observer) {}

    void BatchScheduler::notifyFile(const ConversionTask& task, const FileConversionOutcome& outcome) {
        if (m_observer) {
            m_observer->onFileFinished(task, outcome);
        }
    }

    void BatchScheduler::cancelRemaining(const std::vector<ConversionTask>& tasks, std::size_t from) {
        for (std::size_t i = from; i < tasks.size(); ++i) {
            m_stats.recordFailed(tasks[i].inputPath.string(), "Cancelled");
            notifyFile(tasks[i], FileConversionOutcome::failure("Cancelled", ErrorKind::Cancelled));
        }
    }

    void BatchScheduler::runBatch(const std::vector<ConversionTask>& tasks) {
        const std::size_t waveSize = static_cast<std::size_t>(std::max(m_config.maxConcurrency, 1));

        for (std::size_t begin = 0; begin < tasks.size(); begin += waveSize) {
            if (m_cancelled && m_cancelled->load()) {
                cancelRemaining(tasks, begin);
                return;
            }

            const std::size_t end = std::min(begin + waveSize, tasks.size());

            std::vector<std::future<FileConversionOutcome>> wave;
            wave.reserve(end - begin);
            for (std::size_t i = begin; i < end; ++i) {
                const ConversionTask& task = tasks[i];
                try {
                    wave.push_back(std::async(std::launch::async, [this, &task]() {
                        return m_converter.convert(task.inputPath, task.outputPath);
                    }));
                } catch (const std::system_error&) {
                    // No thread available: run it here, the wave bound still holds
                    std::promise<FileConversionOutcome> inline_result;
                    inline_result.set_value(m_converter.convert(task.inputPath, task.outputPath));
                    wave.push_back(inline_result.get_future());
                }
            }

            // Barrier: every task of this wave reaches a terminal state
            for (std::size_t i = 0; i < wave.size(); ++i) {
                notifyFile(tasks[begin + i], wave[i].get());
            }

            if (m_observer) {
                BatchProgress progress;
                progress.completed = end;
                progress.total = tasks.size();
                progress.savedBytes = m_stats.savedBytes();
                m_observer->onWaveCompleted(progress);
            }
        }
    }

} // namespace LazyWebp

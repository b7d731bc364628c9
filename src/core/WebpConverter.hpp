#pragma once

#include "BatchScheduler.hpp"
#include "ConversionTypes.hpp"
#include "ImageCodec.hpp"
#include "ResultAggregator.hpp"
#include "RunStatistics.hpp"
#include <atomic>
#include <memory>
#include <optional>

namespace LazyWebp
{
    /**
     * @brief Entry point used by the CLI and other front ends: discovers
     * tasks, runs them in waves and returns the final report.
     */
    class WebpConverter {
    public:
        /**
         * @param quality clamped to [1, 100]
         * @param codec defaults to OpenCvWebpCodec
         * @param maxConcurrency defaults to clamp(cpus - 1, 1, 4)
         */
        explicit WebpConverter(int quality = DEFAULT_QUALITY,
                               std::shared_ptr<ImageCodec> codec = nullptr,
                               std::optional<int> maxConcurrency = std::nullopt);

        const ConversionConfig& config() const { return m_config; }

        void setObserver(ConversionObserver* observer) { m_observer = observer; }

        /**
         * @brief Stops launching waves; in-flight tasks stop before publishing.
         * Safe to call from any thread or a signal handler. A cancelled
         * converter stays cancelled.
         */
        void cancel() { m_cancelled.store(true); }

        ConversionResult run(const fs::path& input,
                             const std::optional<fs::path>& outputDir = std::nullopt,
                             bool recursive = false);

        /**
         * @throws ConversionError for run-fatal conditions only; per-file
         * failures are listed in the result.
         */
        ConversionResult runAll(const std::vector<fs::path>& inputs,
                                const std::optional<fs::path>& outputDir = std::nullopt,
                                bool recursive = false);

    private:
        ConversionConfig m_config;
        std::shared_ptr<ImageCodec> m_codec;
        ConversionObserver* m_observer = nullptr;
        std::atomic<bool> m_cancelled{false};
        RunStatistics m_stats;
    };

    /**
     * @brief One-shot conversion with the default codec.
     */
    ConversionResult runConversion(const std::vector<fs::path>& inputs,
                                   const std::optional<fs::path>& outputDir,
                                   int quality,
                                   bool recursive);

} // namespace LazyWebp

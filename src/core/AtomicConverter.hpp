#pragma once

#include "ConversionTypes.hpp"
#include "ImageCodec.hpp"
#include "RunStatistics.hpp"
#include <atomic>
#include <memory>

namespace LazyWebp
{
    /**
     * @brief Converts one file through a private temp file and publishes it
     * with a single rename, so the output path never holds partial data.
     *
     * Failures are recorded in the run statistics and returned as an outcome;
     * nothing thrown inside a conversion escapes convert().
     */
    class AtomicConverter {
    public:
        AtomicConverter(std::shared_ptr<ImageCodec> codec,
                        RunStatistics& stats,
                        const ConversionConfig& config,
                        const std::atomic<bool>* cancelled = nullptr);

        FileConversionOutcome convert(const fs::path& inputPath, const fs::path& outputPath);

        /**
         * @brief `<dir>/.lazywebp-<16 hex>.webp`, random part from OpenSSL.
         */
        static fs::path makeTempPath(const fs::path& outputPath);

        EncodeOptions encodeOptionsFor(const ImageMetadata& meta) const;

    private:
        void writeFile(const fs::path& path, const std::vector<std::uint8_t>& bytes) const;
        void publish(const fs::path& tempPath, const fs::path& outputPath) const;
        bool isCancelled() const;

        // Removes the temp file (errors swallowed) and records the failure
        FileConversionOutcome fail(const fs::path& inputPath,
                                   const std::optional<fs::path>& tempPath,
                                   const std::string& message,
                                   std::optional<ErrorKind> kind);

        std::shared_ptr<ImageCodec> m_codec;
        RunStatistics& m_stats;
        ConversionConfig m_config;
        const std::atomic<bool>* m_cancelled;
    };

} // namespace LazyWebp

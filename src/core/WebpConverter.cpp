#include "WebpConverter.hpp"
#include "AtomicConverter.hpp"
#include "FileSystemTool.hpp"
#include "TaskDiscovery.hpp"

namespace LazyWebp
{
    WebpConverter::WebpConverter(int quality, std::shared_ptr<ImageCodec> codec, std::optional<int> maxConcurrency)
        : m_config(ConversionConfig::make(quality, maxConcurrency)),
          m_codec(codec ? std::move(codec) : std::make_shared<OpenCvWebpCodec>()) {}

    ConversionResult WebpConverter::run(const fs::path& input, const std::optional<fs::path>& outputDir, bool recursive) {
        return runAll({input}, outputDir, recursive);
    }

    ConversionResult WebpConverter::runAll(const std::vector<fs::path>& inputs,
                                           const std::optional<fs::path>& outputDir,
                                           bool recursive) {
        m_stats.start();

        if (outputDir) {
            try {
                FileSystemTool::createDirectory(*outputDir);
            } catch (const fs::filesystem_error& e) {
                throw ConversionError(ErrorKind::AccessDenied,
                    "Could not create output directory '" + outputDir->string() + "': " + e.what());
            }
        }

        TaskDiscovery discovery(m_stats);
        const std::vector<ConversionTask> tasks = discovery.discover(inputs, outputDir, recursive);

        AtomicConverter converter(m_codec, m_stats, m_config, &m_cancelled);
        BatchScheduler scheduler(converter, m_stats, m_config, &m_cancelled, m_observer);
        scheduler.runBatch(tasks);

        m_stats.finish();
        return ResultAggregator::finalize(m_stats.snapshot(), m_cancelled.load());
    }

    ConversionResult runConversion(const std::vector<fs::path>& inputs,
                                   const std::optional<fs::path>& outputDir,
                                   int quality,
                                   bool recursive) {
        WebpConverter converter(quality);
        return converter.runAll(inputs, outputDir, recursive);
    }

} // namespace LazyWebp

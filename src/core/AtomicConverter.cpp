#include "AtomicConverter.hpp"
#include "FileSystemTool.hpp"
#include "SkipPolicy.hpp"
#include "../utils/Console.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/rand.h>
#include <opencv2/core.hpp>

namespace LazyWebp
{
    AtomicConverter::AtomicConverter(std::shared_ptr<ImageCodec> codec,
                                     RunStatistics& stats,
                                     const ConversionConfig& config,
                                     const std::atomic<bool>* cancelled)
        : m_codec(std::move(codec)), m_stats(stats), m_config(config), m_cancelled(cancelled) {}

    bool AtomicConverter::isCancelled() const {
        return m_cancelled && m_cancelled->load();
    }

    fs::path AtomicConverter::makeTempPath(const fs::path& outputPath) {
        unsigned char buffer[8];
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw ConversionError(ErrorKind::Filesystem, "Failed to generate random bytes for temp file name.");
        }

        std::stringstream ss;
        ss << TEMP_FILE_PREFIX;
        for (std::size_t i = 0; i < sizeof(buffer); ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
        }
        ss << OUTPUT_EXTENSION;
        return outputPath.parent_path() / ss.str();
    }

    EncodeOptions AtomicConverter::encodeOptionsFor(const ImageMetadata& meta) const {
        EncodeOptions options;
        options.quality = m_config.quality;
        options.autoRotate = true;
        if (meta.colorSpace == "rgb" || meta.colorSpace == "display-p3") {
            options.targetColorSpace = "srgb";
        }
        options.effort = WEBP_EFFORT;
        options.alphaQuality = WEBP_ALPHA_QUALITY;
        options.lossless = false;
        return options;
    }

    void AtomicConverter::writeFile(const fs::path& path, const std::vector<std::uint8_t>& bytes) const {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ConversionError(ErrorKind::Filesystem, "Could not open temp file " + path.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            throw ConversionError(ErrorKind::Filesystem, "Could not write temp file " + path.string());
        }
    }

    void AtomicConverter::publish(const fs::path& tempPath, const fs::path& outputPath) const {
        std::error_code ec;
        fs::file_status existing = fs::symlink_status(outputPath, ec);
        if (!ec && fs::is_symlink(existing)) {
            throw ConversionError(ErrorKind::RefusedSymlinkOverwrite,
                "Output path is a symbolic link, refusing to overwrite: " + outputPath.string());
        }

        if (isCancelled()) {
            throw ConversionError(ErrorKind::Cancelled, "Cancelled");
        }

        fs::rename(tempPath, outputPath);
    }

    FileConversionOutcome AtomicConverter::convert(const fs::path& inputPath, const fs::path& outputPath) {
        std::optional<fs::path> tempPath;

        try {
            if (!SkipPolicy::shouldConvert(inputPath, outputPath)) {
                m_stats.recordSkipped();
                Console::detail("Up to date: '" + outputPath.filename().string() + "'.");
                return FileConversionOutcome::skip();
            }

            if (isCancelled()) {
                throw ConversionError(ErrorKind::Cancelled, "Cancelled");
            }

            const std::uintmax_t inputSize = fs::file_size(inputPath);

            tempPath = makeTempPath(outputPath);

            // Recursive runs write into subdirectories that may not exist yet
            FileSystemTool::createDirectoryForFile(outputPath);

            const std::vector<std::uint8_t> bytes = m_codec->encodeWith(inputPath,
                [this](const ImageMetadata& meta) { return encodeOptionsFor(meta); });
            writeFile(*tempPath, bytes);

            const std::uintmax_t outputSize = fs::file_size(*tempPath);
            if (outputSize == 0) {
                throw ConversionError(ErrorKind::EmptyOutput, "Generated file is empty");
            }

            publish(*tempPath, outputPath);

            m_stats.recordProcessed(inputSize, outputSize);
            Console::detail("Converted '" + inputPath.filename().string() + "' to '"
                            + outputPath.filename().string() + "'.");
            return FileConversionOutcome::converted(inputSize, outputSize);

        } catch (const ConversionError& e) {
            return fail(inputPath, tempPath, e.what(), e.kind());
        } catch (const cv::Exception& e) {
            return fail(inputPath, tempPath, e.what(), ErrorKind::Codec);
        } catch (const fs::filesystem_error& e) {
            return fail(inputPath, tempPath, e.what(), ErrorKind::Filesystem);
        } catch (const std::exception& e) {
            return fail(inputPath, tempPath, e.what(), std::nullopt);
        } catch (...) {
            return fail(inputPath, tempPath, "Unknown error", std::nullopt);
        }
    }

    FileConversionOutcome AtomicConverter::fail(const fs::path& inputPath,
                                                const std::optional<fs::path>& tempPath,
                                                const std::string& message,
                                                std::optional<ErrorKind> kind) {
        if (tempPath) {
            FileSystemTool::removeQuietly(*tempPath);
        }
        m_stats.recordFailed(inputPath.string(), message);
        return FileConversionOutcome::failure(message, kind);
    }

} // namespace LazyWebp

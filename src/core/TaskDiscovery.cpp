#include "TaskDiscovery.hpp"
#include "FileSystemTool.hpp"
#include "Preflight.hpp"
#include "../utils/Console.hpp"
#include <system_error>

namespace LazyWebp
{
    TaskDiscovery::TaskDiscovery(RunStatistics& stats)
        : m_stats(stats) {}

    std::vector<ConversionTask> TaskDiscovery::discover(const std::vector<fs::path>& inputs,
                                                        const std::optional<fs::path>& outputDir,
                                                        bool recursive) {
        std::vector<ConversionTask> tasks;

        for (const auto& input : inputs) {
            std::error_code ec;
            fs::file_status status = fs::status(input, ec);

            if (fs::is_regular_file(status)) {
                collectFile(input, outputDir, tasks);
            } else if (fs::is_directory(status)) {
                collectDirectory(input, outputDir, recursive, tasks);
            } else if (ec || !fs::exists(status)) {
                throw ConversionError(ErrorKind::InvalidInputKind,
                    "Input does not exist: " + input.string());
            } else {
                throw ConversionError(ErrorKind::InvalidInputKind,
                    "Input is neither a file nor a directory: " + input.string());
            }
        }

        if (m_stats.totalFiles() == 0) {
            throw ConversionError(ErrorKind::NoImagesFound, "No valid image files found");
        }
        return tasks;
    }

    void TaskDiscovery::collectFile(const fs::path& inputPath,
                                    const std::optional<fs::path>& outputDir,
                                    std::vector<ConversionTask>& tasks) {
        if (!FileSystemTool::isImageFile(inputPath)) {
            Console::warning("Skipping: not a supported image file: " + inputPath.string());
            m_stats.addSkippedDiscovery();
            return;
        }

        const fs::path targetDir = outputDir ? *outputDir : inputPath.parent_path();
        addTask(inputPath, FileSystemTool::webpPathFor(inputPath, targetDir), tasks);
    }

    void TaskDiscovery::collectDirectory(const fs::path& inputDir,
                                         const std::optional<fs::path>& outputDir,
                                         bool recursive,
                                         std::vector<ConversionTask>& tasks) {
        if (outputDir) {
            Preflight::validateDirectories(inputDir, *outputDir);
        }

        std::vector<fs::path> images;
        try {
            images = FileSystemTool::getImageFiles(inputDir, recursive);
        } catch (const fs::filesystem_error& e) {
            throw ConversionError(ErrorKind::AccessDenied,
                "Could not list directory '" + inputDir.string() + "': " + e.what());
        }

        for (const auto& inputPath : images) {
            fs::path outputPath;
            if (!outputDir) {
                outputPath = FileSystemTool::webpPathFor(inputPath, inputPath.parent_path());
            } else {
                // Mirror the entry's subdirectory below the output root
                std::error_code ec;
                fs::path relDir = fs::relative(inputPath.parent_path(), inputDir, ec);
                if (ec || relDir.empty()) relDir = ".";
                outputPath = FileSystemTool::webpPathFor(inputPath, (*outputDir / relDir).lexically_normal());
            }
            addTask(inputPath, outputPath, tasks);
        }
    }

    void TaskDiscovery::addTask(const fs::path& inputPath, const fs::path& outputPath,
                                std::vector<ConversionTask>& tasks) {
        if (FileSystemTool::isSameFile(inputPath, outputPath)) {
            Console::warning("Skipping: source and output are the same file: " + inputPath.string());
            m_stats.addSkippedDiscovery();
            return;
        }

        m_stats.addDiscovered();
        tasks.push_back({inputPath, outputPath});
    }

} // namespace LazyWebp

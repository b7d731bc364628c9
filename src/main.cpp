#include "core/WebpConverter.hpp"
#include "utils/ArgParser.h"
#include "utils/Console.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>
#include <iomanip>

#ifndef LAZYWEBP_VERSION
#define LAZYWEBP_VERSION "0.0.0"
#endif

using namespace LazyWebp;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FILE_FAILURES = 1;
constexpr int EXIT_FATAL = 2;

std::atomic<WebpConverter*> g_activeConverter{nullptr};

extern "C" void handleInterrupt(int) {
    WebpConverter* converter = g_activeConverter.load();
    if (converter) converter->cancel();
}

/**
 * @brief Prints the wave progress line and failures as they happen.
 */
class ConsoleObserver : public ConversionObserver {
public:
    void onFileFinished(const ConversionTask& task, const FileConversionOutcome& outcome) override {
        if (!outcome.success) {
            std::string kind = outcome.errorKind ? toString(*outcome.errorKind) : "Error";
            Console::detail("Failed '" + task.inputPath.string() + "' (" + kind + "): " + outcome.error);
        }
    }

    void onWaveCompleted(const BatchProgress& progress) override {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(1) << "Progress: " << progress.fraction() * 100.0 << "% ("
           << progress.completed << "/" << progress.total << ") | Saved: "
           << std::setprecision(2) << static_cast<double>(progress.savedBytes) / 1024.0 / 1024.0 << "MB";
        Console::progress(ss.str());
    }
};

void printSummary(const ConversionResult& results) {
    Console::endProgress();
    Console::info(std::string("\nConversion ") + (results.cancelled ? "cancelled" : "completed") + ":");
    Console::info("  Total files: " + std::to_string(results.totalFiles));
    Console::info("  Processed:   " + std::to_string(results.processed));
    Console::info("  Skipped:     " + std::to_string(results.skipped));
    Console::info("  Failed:      " + std::to_string(results.failed.size()));
    Console::info("  Duration:    " + results.duration);
    Console::info("  Total size:  " + results.totalSize);
    Console::info("  Saved:       " + results.savedSize);
    Console::info("  Compression: " + results.compressionRatio);

    if (results.hasFailures()) {
        Console::info("\nFailed conversions:");
        for (const auto& f : results.failed) {
            Console::info("  - " + f.file + ": " + f.error);
        }
    }
}

}

int main(int argc, char** argv) {
    ArgParser parser;
    ArgParser::Arguments args;

    try {
        args = parser.parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run lazywebp --help for usage" << std::endl;
        return EXIT_FATAL;
    }

    if (args.help) {
        std::cout << parser.help() << std::endl;
        return EXIT_OK;
    }
    if (args.version) {
        std::cout << LAZYWEBP_VERSION << std::endl;
        return EXIT_OK;
    }

    Console::setVerbose(args.verbose);
    Console::setQuiet(args.json);

    std::vector<fs::path> inputs(args.inputs.begin(), args.inputs.end());
    std::optional<fs::path> outputDir;
    if (args.outputDir) outputDir = fs::path(*args.outputDir);

    WebpConverter converter(args.quality, nullptr, args.jobs);
    ConsoleObserver observer;
    converter.setObserver(&observer);

    g_activeConverter.store(&converter);
    std::signal(SIGINT, handleInterrupt);

    ConversionResult results;
    try {
        results = converter.runAll(inputs, outputDir, args.recursive);
    } catch (const std::exception& e) {
        g_activeConverter.store(nullptr);
        Console::endProgress();
        Console::error(e.what());
        return EXIT_FATAL;
    }
    g_activeConverter.store(nullptr);

    if (args.json) {
        std::cout << ResultAggregator::toJson(results).dump(2) << std::endl;
    } else {
        printSummary(results);
    }

    return results.hasFailures() ? EXIT_FILE_FAILURES : EXIT_OK;
}

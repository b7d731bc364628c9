#include "ArgParser.h"
#include <algorithm>
#include <stdexcept>

ArgParser::ArgParser()
    : m_options("lazywebp", "Convert images (jpg, jpeg, png, gif, bmp, tiff, webp) to WebP format")
{
    m_options.positional_help("<input...>");
    m_options.add_options()
        ("q,quality", "WebP quality 1-100", cxxopts::value<int>()->default_value("90"))
        ("o,output", "Output directory (default: next to source)", cxxopts::value<std::string>())
        ("r,recursive", "Process subdirectories recursively", cxxopts::value<bool>()->default_value("false"))
        ("j,jobs", "Number of images converted concurrently", cxxopts::value<int>())
        ("json", "Print the final report as JSON", cxxopts::value<bool>()->default_value("false"))
        ("V,verbose", "Log every converted file", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Show this help message")
        ("v,version", "Show version number")
        ("inputs", "Files or directories to convert", cxxopts::value<std::vector<std::string>>());
    m_options.parse_positional({"inputs"});
}

std::string ArgParser::help() const {
    return m_options.help();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    Arguments args;
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            args.help = true;
            return args;
        }
        if (result.count("version")) {
            args.version = true;
            return args;
        }

        if (result.count("inputs")) {
            args.inputs = result["inputs"].as<std::vector<std::string>>();
        }
        if (args.inputs.empty()) {
            throw std::runtime_error("no input file or directory specified");
        }

        args.quality = std::clamp(result["quality"].as<int>(), 1, 100);
        if (result.count("output")) {
            args.outputDir = result["output"].as<std::string>();
        }
        if (result.count("jobs")) {
            args.jobs = std::max(result["jobs"].as<int>(), 1);
        }
        args.recursive = result["recursive"].as<bool>();
        args.json = result["json"].as<bool>();
        args.verbose = result["verbose"].as<bool>();
        return args;

    } catch (const cxxopts::OptionException& e) {
        throw std::runtime_error(e.what());
    }
}

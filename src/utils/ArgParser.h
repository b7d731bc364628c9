#ifndef LAZYWEBP_ARG_PARSER_H
#define LAZYWEBP_ARG_PARSER_H

#include <optional>
#include <string>
#include <vector>
#include "cxxopts.hpp" // Requires cxxopts dependency

/**
 * @brief Command line parsing for the lazywebp executable.
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::vector<std::string> inputs;
        std::optional<std::string> outputDir;
        int quality = 90;
        std::optional<int> jobs;
        bool recursive = false;
        bool json = false;
        bool verbose = false;
        bool help = false;
        bool version = false;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @return The Arguments struct. `help`/`version` short-circuit validation.
     * @throws std::runtime_error on unknown options, malformed values or
     *         missing inputs.
     */
    Arguments parseArgs(int argc, char** argv);

    std::string help() const;

private:
    cxxopts::Options m_options;
};

#endif // LAZYWEBP_ARG_PARSER_H

#pragma once

#include <string>

/**
 * @brief Line-oriented console logging shared by all conversion threads.
 *
 * Every call writes one complete line under a process-wide lock so output
 * from concurrently running conversions never interleaves.
 */
class Console {
public:
    // Regular status line on stdout
    static void info(const std::string& message);

    // Per-file detail, printed only in verbose mode
    static void detail(const std::string& message);

    // "Warning: ..." on stderr
    static void warning(const std::string& message);

    // "ERROR: ..." on stderr
    static void error(const std::string& message);

    /**
     * @brief Rewrites the current stdout line (carriage return, no newline).
     */
    static void progress(const std::string& message);

    // Terminates a pending progress line, if any
    static void endProgress();

    static void setVerbose(bool verbose);

    static void setQuiet(bool quiet);
};

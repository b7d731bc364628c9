#include "Console.hpp"
#include <iostream>
#include <mutex>
#include <atomic>

namespace {
std::mutex g_consoleMutex;
std::atomic<bool> g_verbose{false};
std::atomic<bool> g_quiet{false};
bool g_progressPending = false;

// Caller must hold g_consoleMutex
void breakProgressLine() {
    if (g_progressPending) {
        std::cout << std::endl;
        g_progressPending = false;
    }
}
}

void Console::info(const std::string& message) {
    if (g_quiet) return;
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    breakProgressLine();
    std::cout << message << std::endl;
}

void Console::detail(const std::string& message) {
    if (!g_verbose || g_quiet) return;
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    breakProgressLine();
    std::cout << message << std::endl;
}

void Console::warning(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    breakProgressLine();
    std::cerr << "Warning: " << message << std::endl;
}

void Console::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    breakProgressLine();
    std::cerr << "ERROR: " << message << std::endl;
}

void Console::progress(const std::string& message) {
    if (g_quiet) return;
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::cout << "\r" << message << std::flush;
    g_progressPending = true;
}

void Console::endProgress() {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    breakProgressLine();
}

void Console::setVerbose(bool verbose) {
    g_verbose = verbose;
}

void Console::setQuiet(bool quiet) {
    g_quiet = quiet;
}

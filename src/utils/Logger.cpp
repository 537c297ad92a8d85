#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#ifndef _WIN32
#include <unistd.h>
#else
#include <io.h>
#endif

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    bool stderrIsTerminal() {
#ifdef _WIN32
        static const bool tty = _isatty(_fileno(stderr)) != 0;
#else
        static const bool tty = isatty(STDERR_FILENO) != 0;
#endif
        return tty;
    }

    std::string trimTrailingNewlines(const std::string& message) {
        std::string trimmed = message;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }
        return trimmed;
    }
}

void Logger::appendToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;

    std::ofstream logFile(logFilePath, std::ios::app);
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    logFile << std::put_time(std::localtime(&now), "[%Y-%m-%d %H:%M:%S] ");
    switch (level) {
        case LogLevel::ERROR: logFile << "[ERROR] "; break;
        case LogLevel::WARNING: logFile << "[WARN] "; break;
        case LogLevel::INFO: logFile << "[INFO] "; break;
        case LogLevel::SUCCESS: logFile << "[OK] "; break;
        default: logFile << "[DEBUG] "; break;
    }
    logFile << trimTrailingNewlines(message) << std::endl;
}

void Logger::printToStderr(LogLevel level, const std::string& message) {
    const bool color = stderrIsTerminal();

    std::string prefix;
    switch (level) {
        case LogLevel::INFO:
            prefix = color ? CYAN + "[Info] " + RESET : "[Info] ";
            break;
        case LogLevel::SUCCESS:
            prefix = color ? GREEN + "[OK] " + RESET : "[OK] ";
            break;
        case LogLevel::WARNING:
            prefix = color ? YELLOW + "[Warn] " + RESET : "[Warn] ";
            break;
        case LogLevel::ERROR:
            prefix = color ? RED + BOLD + "[Error] " + RESET : "[Error] ";
            break;
        case LogLevel::DEBUG:
            prefix = color ? GRAY + "[Debug] " + RESET : "[Debug] ";
            break;
    }

    // Multi-line messages get the prefix on every line
    std::stringstream ss(trimTrailingNewlines(message));
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << '\n';
    }
    std::cerr.flush();
}

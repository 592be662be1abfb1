#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&timeT, &local);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &local);
    return timeBuf;
}

Logger::Logger(std::string logFile, std::string errorLogFile, bool echo)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), echo_(echo) {}

void Logger::logMessage(const std::string& message) const {
    write(logFile_, "[" + currentTimestamp() + "] " + message, false);
}

void Logger::logWarning(const std::string& message) const {
    write(logFile_, "[" + currentTimestamp() + "] WARNING: " + message, false);
}

void Logger::logError(const std::string& message) const {
    write(errorLogFile_, "[" + currentTimestamp() + "] ERROR: " + message, true);
}

void Logger::write(const std::string& path, const std::string& entry, bool toStderr) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (echo_) {
        (toStderr ? std::cerr : std::cout) << entry << std::endl;
    }
    if (path.empty()) {
        return;
    }

    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }

    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

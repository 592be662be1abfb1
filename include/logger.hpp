/**
 * @file logger.hpp
 * @brief Timestamped console and file logging for SmbRelay.
 *
 * Messages are echoed to the console and appended to a log file; errors additionally go to a
 * dedicated error log.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <mutex>
#include <string>

/**
 * @brief Writes timestamped log lines to the console and to log files.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path receiving informational and warning lines. Empty disables file output.
     * @param errorLogFile Path receiving error lines. Empty disables file output.
     * @param echo If false, nothing is written to stdout/stderr.
     * @note Parent directories are created on first write.
     */
    Logger(std::string logFile, std::string errorLogFile, bool echo = true);

    /**
     * @brief Logs an informational message.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning to the regular log file.
     *
     * @param message Warning to log.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to the error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    const std::string& logFile() const { return logFile_; }
    const std::string& errorLogFile() const { return errorLogFile_; }

private:
    void write(const std::string& path, const std::string& entry, bool toStderr) const;

    std::string logFile_;        ///< Path to the log file.
    std::string errorLogFile_;   ///< Path to the error log file.
    bool echo_;                  ///< Echo entries to the console.
    mutable std::mutex mutex_;   ///< Serializes writers.
};

/**
 * @brief Formats the current local time as "YYYY-mm-dd HH:MM:SS".
 */
std::string currentTimestamp();

#endif // LOGGER_HPP

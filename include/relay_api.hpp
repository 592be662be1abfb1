/**
 * @file relay_api.hpp
 * @brief High-level API for SmbRelay.
 *
 * Wires configuration, logging, the SMB backend and the transfer engine together for one-shot
 * uploads, connection checks and the long-running bot.
 */

#ifndef RELAY_API_HPP
#define RELAY_API_HPP

#include <expected>
#include <string>

/**
 * @brief Entry points used by the command line front end.
 */
class RelayAPI {
public:
    /**
     * @brief Uploads one local file to the configured share.
     *
     * @param configFile Path to the JSON configuration file (empty for environment only).
     * @param localPath File to upload.
     * @param filename Name to store the file under; empty uses the local file's name.
     * @return std::expected<std::string, std::string> Final remote path or an error message.
     */
    static std::expected<std::string, std::string> backupFile(const std::string& configFile,
                                                              const std::string& localPath,
                                                              const std::string& filename = "");

    /**
     * @brief Opens and closes a session to check the configured share.
     *
     * @param configFile Path to the JSON configuration file (empty for environment only).
     * @return std::expected<std::string, std::string> A description of the share or an error message.
     */
    static std::expected<std::string, std::string> checkStatus(const std::string& configFile);

    /**
     * @brief Runs the Telegram bot until SIGINT or SIGTERM.
     *
     * @param configFile Path to the JSON configuration file (empty for environment only).
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> runBot(const std::string& configFile);
};

#endif // RELAY_API_HPP

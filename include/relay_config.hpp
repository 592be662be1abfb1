/**
 * @file relay_config.hpp
 * @brief Configuration management for the SmbRelay backup bot.
 *
 * Defines the SMB share settings consumed by the transfer core and the relay configuration
 * that loads them, together with the Telegram and logging settings, from a JSON file with
 * environment variable overrides.
 *
 * @note Environment variables (SMB_USERNAME, SMB_PASSWORD, ...) take precedence over the
 * JSON file so that secrets can stay out of the file.
 */

#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <json/json.h>

/**
 * @brief Raised when a mandatory setting is absent or malformed.
 *
 * Configuration errors are fatal: they surface at construction time and no transfer is attempted.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief How the transfer engine treats a failed existence probe.
 */
enum class ProbeFailurePolicy {
    AssumeAbsent, ///< Keep the original filename, as if nothing existed at the path.
    Abort         ///< Fail the transfer with an existence-check error.
};

/**
 * @brief Immutable connection settings for the remote SMB share.
 *
 * Every field except the server display name is mandatory. The constructor validates them and
 * throws ConfigurationError naming all missing settings at once.
 */
class ShareConfig {
public:
    /**
     * @brief Constructs and validates share settings.
     *
     * @param username Account used for NTLMv2 authentication.
     * @param password Account password.
     * @param server Server address (host name or IP).
     * @param share Share name on the server.
     * @param port TCP port for direct-TCP SMB (usually 445).
     * @param backupDirectory Directory on the share receiving the files ("/" for the share root).
     * @param serverName Optional server display name.
     * @throws ConfigurationError If a mandatory setting is empty or the port is out of range.
     */
    ShareConfig(std::string username,
                std::string password,
                std::string server,
                std::string share,
                int port = 445,
                std::string backupDirectory = "/",
                std::string serverName = "");

    const std::string& username() const { return username_; }
    const std::string& password() const { return password_; }
    const std::string& server() const { return server_; }
    const std::string& serverName() const { return serverName_; }
    const std::string& share() const { return share_; }
    int port() const { return port_; }
    const std::string& backupDirectory() const { return backupDirectory_; }

    /// Identity presented to the server during session setup.
    const std::string& clientName() const { return clientName_; }
    ProbeFailurePolicy probeFailurePolicy() const { return probeFailurePolicy_; }
    /// Per-operation timeout in seconds, 0 for none.
    int timeoutSeconds() const { return timeoutSeconds_; }

    /**
     * @brief Returns a copy with a different client identity.
     *
     * @param clientName Non-empty identity string.
     * @throws ConfigurationError If clientName is empty.
     */
    ShareConfig withClientName(std::string clientName) const;

    ShareConfig withProbeFailurePolicy(ProbeFailurePolicy policy) const;

    /**
     * @brief Returns a copy with a per-operation timeout.
     *
     * @param seconds Timeout in seconds, 0 disables it.
     * @throws ConfigurationError If seconds is negative.
     */
    ShareConfig withTimeoutSeconds(int seconds) const;

private:
    std::string username_;                ///< SMB account name.
    std::string password_;                ///< SMB account password.
    std::string server_;                  ///< Server address.
    std::string serverName_;              ///< Optional server display name.
    std::string share_;                   ///< Share name.
    int port_;                            ///< Direct-TCP port.
    std::string backupDirectory_;         ///< Target directory on the share.
    std::string clientName_ = "SmbRelayBot";
    ProbeFailurePolicy probeFailurePolicy_ = ProbeFailurePolicy::AssumeAbsent;
    int timeoutSeconds_ = 0;
};

/**
 * @brief Parses a probe failure policy name ("assume_absent" or "abort").
 *
 * @throws ConfigurationError On an unknown name.
 */
ProbeFailurePolicy parseProbeFailurePolicy(const std::string& name);

/**
 * @brief Telegram bot settings.
 */
struct TelegramConfig {
    std::string botToken;            ///< Bot API token, required only to run the bot.
    std::int64_t authorizedUserId = 0; ///< The single user allowed to talk to the bot; 0 allows nobody.
    int pollTimeout = 30;            ///< Long-poll timeout for getUpdates, in seconds.
};

/**
 * @brief Configuration class for the relay.
 *
 * Loads settings from a JSON configuration file and the process environment, validating the
 * share settings eagerly.
 */
class RelayConfig {
public:
    /// Looks up an environment variable; returns std::nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Constructs a configuration instance from a JSON file and the process environment.
     *
     * @param configFile Path to the JSON configuration file. An empty path uses the environment only.
     * @throws ConfigurationError If the file is unreadable or invalid, or a mandatory setting is missing.
     */
    explicit RelayConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from parsed JSON and an environment lookup.
     *
     * @param configJson Parsed configuration (may be null).
     * @param env Environment lookup used for overrides.
     * @throws ConfigurationError If a mandatory setting is missing or malformed.
     */
    RelayConfig(const Json::Value& configJson, const EnvLookup& env);

    /// Environment lookup backed by std::getenv. Empty variables count as unset.
    static std::optional<std::string> processEnvironment(const std::string& name);

    ShareConfig share;           ///< SMB share settings.
    TelegramConfig telegram;     ///< Telegram bot settings.
    std::string logDir;          ///< Directory receiving relay.log and errors.log.
    std::string logFile;         ///< Path to the log file.
    std::string errorLogFile;    ///< Path to the error log file.

private:
    static Json::Value loadFile(const std::string& configFile);
    static ShareConfig loadShare(const Json::Value& smb, const EnvLookup& env);
    static TelegramConfig loadTelegram(const Json::Value& telegram, const EnvLookup& env);
};

#endif // RELAY_CONFIG_HPP

/**
 * @file relay_bot.hpp
 * @brief Telegram front end of SmbRelay.
 *
 * Receives messages from the single authorized user, answers the /start, /help and /status
 * commands, and hands every received file to the transfer engine, reporting progress and the
 * final stored path back in the chat.
 */

#ifndef RELAY_BOT_HPP
#define RELAY_BOT_HPP

#include <csignal>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <json/json.h>
#include "inbound_file.hpp"
#include "relay_config.hpp"
#include "share_session.hpp"
#include "telegram_api.hpp"
#include "transfer_engine.hpp"

class Logger;

/// Set by SIGINT/SIGTERM; the poll loop exits when it becomes non-zero.
extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Signal handler that requests a graceful shutdown.
 */
void signalHandler(int sig);

/**
 * @brief Dispatches Telegram updates to the relay.
 */
class RelayBot {
public:
    static constexpr const char* kUnauthorizedText = "Sorry, you are not authorized to use this bot.";

    /**
     * @brief Constructs the bot.
     *
     * @param telegram Telegram settings (authorized user, poll timeout).
     * @param api Bot API client.
     * @param sessions Session manager used by /status.
     * @param engine Transfer engine receiving the files.
     * @param logger Log sink.
     * @note All references must outlive the bot.
     */
    RelayBot(const TelegramConfig& telegram, TelegramApi& api, SessionManager& sessions,
             TransferEngine& engine, const Logger& logger);

    /**
     * @brief Runs the long-poll loop until gShutdownFlag is set.
     *
     * Installs SIGINT/SIGTERM handlers. API errors are logged and retried after a short pause.
     */
    void run();

    /**
     * @brief Polls once and dispatches the returned updates.
     *
     * @return std::expected<size_t, std::string> Number of updates handled or the polling error.
     */
    std::expected<size_t, std::string> pollOnce();

    /**
     * @brief Handles one update object; errors are logged, never thrown.
     */
    void handleUpdate(const Json::Value& update);

    /**
     * @brief Handles one message object.
     */
    void handleMessage(const Json::Value& message);

    /**
     * @brief Returns true if userId is the configured authorized user.
     *
     * An authorized id of 0 authorizes nobody.
     */
    bool isAuthorized(std::int64_t userId) const;

    /**
     * @brief Checks the share connection and formats the /status reply.
     */
    std::string statusText();

    /// Offset to pass to the next getUpdates call.
    std::int64_t nextOffset() const { return offset_; }

private:
    void handleCommand(std::int64_t chatId, const std::string& command, const Json::Value& from);
    void processFile(std::int64_t chatId, const InboundFile& file);
    std::optional<std::int64_t> reply(std::int64_t chatId, const std::string& text);
    void updateStatus(std::int64_t chatId, const std::optional<std::int64_t>& messageId, const std::string& text);

    const TelegramConfig& telegram_;
    TelegramApi& api_;
    SessionManager& sessions_;
    TransferEngine& engine_;
    const Logger& logger_;
    std::int64_t offset_ = 0;
};

/**
 * @brief Creates an empty temporary file for a download.
 *
 * @return std::expected<std::string, std::string> Path of the new file or an error message.
 */
std::expected<std::string, std::string> makeTemporaryFile();

#endif // RELAY_BOT_HPP

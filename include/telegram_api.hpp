/**
 * @file telegram_api.hpp
 * @brief Telegram Bot API client for SmbRelay.
 *
 * Provides the interface the relay bot talks to and an implementation over HTTPS using libcurl,
 * with responses parsed by jsoncpp.
 *
 * @note Requires libcurl. Install via vcpkg on Windows, Homebrew on macOS, or apt on Linux.
 */

#ifndef TELEGRAM_API_HPP
#define TELEGRAM_API_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>

/**
 * @brief Interface for the Telegram Bot API calls used by the relay.
 */
class TelegramApi {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~TelegramApi() = default;

    /**
     * @brief Long-polls for new updates.
     *
     * @param offset Identifier of the first update to return.
     * @param timeoutSeconds Long-poll timeout.
     * @return std::expected<Json::Value, std::string> The array of updates or an error message.
     */
    virtual std::expected<Json::Value, std::string> getUpdates(std::int64_t offset, int timeoutSeconds) = 0;

    /**
     * @brief Sends a text message.
     *
     * @param chatId Target chat.
     * @param text Message text.
     * @return std::expected<std::int64_t, std::string> Id of the sent message or an error message.
     */
    virtual std::expected<std::int64_t, std::string> sendMessage(std::int64_t chatId, const std::string& text) = 0;

    /**
     * @brief Replaces the text of a message previously sent by the bot.
     */
    virtual std::expected<void, std::string> editMessageText(std::int64_t chatId, std::int64_t messageId,
                                                             const std::string& text) = 0;

    /**
     * @brief Resolves a file id to a server-side file path.
     *
     * @param fileId Id from a media object.
     * @return std::expected<std::string, std::string> The file_path or an error message.
     */
    virtual std::expected<std::string, std::string> getFilePath(const std::string& fileId) = 0;

    /**
     * @brief Downloads a file to the local disk.
     *
     * Gives up when the transfer stalls or gShutdownFlag is set.
     *
     * @param filePath Server-side path returned by getFilePath().
     * @param localPath Destination; overwritten if present.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> downloadFile(const std::string& filePath, const std::string& localPath) = 0;
};

/**
 * @brief Telegram Bot API over HTTPS with libcurl.
 */
class CurlTelegramApi : public TelegramApi {
public:
    /**
     * @brief Constructs a client for one bot.
     *
     * @param botToken Bot token issued by BotFather.
     * @param apiBase Base URL of the Bot API server.
     */
    explicit CurlTelegramApi(std::string botToken, std::string apiBase = "https://api.telegram.org");

    std::expected<Json::Value, std::string> getUpdates(std::int64_t offset, int timeoutSeconds) override;
    std::expected<std::int64_t, std::string> sendMessage(std::int64_t chatId, const std::string& text) override;
    std::expected<void, std::string> editMessageText(std::int64_t chatId, std::int64_t messageId,
                                                     const std::string& text) override;
    std::expected<std::string, std::string> getFilePath(const std::string& fileId) override;
    std::expected<void, std::string> downloadFile(const std::string& filePath, const std::string& localPath) override;

private:
    /**
     * @brief Calls a Bot API method with url-encoded form fields.
     *
     * @param method Method name ("sendMessage", ...).
     * @param fields Form fields as key/value pairs.
     * @param timeoutSeconds Total request timeout.
     * @return std::expected<Json::Value, std::string> The "result" member or an error message.
     */
    std::expected<Json::Value, std::string> call(const std::string& method,
                                                 const std::vector<std::pair<std::string, std::string>>& fields,
                                                 long timeoutSeconds = 60);

    std::string botToken; ///< Telegram bot token.
    std::string apiBase;  ///< Bot API base URL.
};

/**
 * @brief Extracts the "result" of a Bot API response body.
 *
 * @param body Raw JSON response.
 * @return std::expected<Json::Value, std::string> The result, or the API "description" when "ok" is not true.
 */
std::expected<Json::Value, std::string> parseApiResponse(const std::string& body);

#endif // TELEGRAM_API_HPP

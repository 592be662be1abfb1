#include "relay_bot.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

namespace {

constexpr int kRetryDelaySeconds = 5;

const char* kHelpText =
    "I can help you back up files to your SMB server.\n\n"
    "Just send me any file, document, photo, video, or forward a message "
    "containing files, and I'll back them up automatically.\n\n"
    "Available commands:\n"
    "/start - Start the bot\n"
    "/help - Show this help message\n"
    "/status - Check the bot and SMB connection status";

const char* kNoFilesText =
    "I didn't find any files to back up in this message. "
    "Please send me a file directly or forward a message containing a file.";

const char* kNoForwardedFilesText = "No files found in the forwarded message that I can back up.";

bool isForwarded(const Json::Value& message) {
    return message.isMember("forward_date") || message.isMember("forward_origin");
}

// "/start@MyBot arg" -> "/start"
std::string commandName(const std::string& text) {
    std::string command = text.substr(0, text.find(' '));
    return command.substr(0, command.find('@'));
}

bool isKnownCommand(const std::string& command) {
    return command == "/start" || command == "/help" || command == "/status";
}

} // namespace

std::expected<std::string, std::string> makeTemporaryFile() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return std::unexpected("No temporary directory: " + ec.message());
    }
    std::string pattern = (dir / "smbrelay-XXXXXX").string();
    int fd = mkstemp(pattern.data());
    if (fd < 0) {
        return std::unexpected("Failed to create temporary file in " + dir.string());
    }
    ::close(fd);
    return pattern;
}

RelayBot::RelayBot(const TelegramConfig& telegram, TelegramApi& api, SessionManager& sessions,
                   TransferEngine& engine, const Logger& logger)
    : telegram_(telegram), api_(api), sessions_(sessions), engine_(engine), logger_(logger) {}

bool RelayBot::isAuthorized(std::int64_t userId) const {
    if (telegram_.authorizedUserId == 0) {
        logger_.logError("No authorized user ID set. Set the AUTHORIZED_USER_ID environment variable.");
        return false;
    }
    return userId == telegram_.authorizedUserId;
}

void RelayBot::run() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    logger_.logMessage("Starting bot...");
    if (telegram_.authorizedUserId != 0) {
        logger_.logMessage("Authorized user ID: " + std::to_string(telegram_.authorizedUserId));
    } else {
        logger_.logWarning("No authorized user ID set! Set the AUTHORIZED_USER_ID environment variable.");
    }

    while (!gShutdownFlag) {
        auto handled = pollOnce();
        if (handled) {
            continue;
        }
        if (gShutdownFlag) {
            break;
        }
        logger_.logError("Polling failed: " + handled.error());
        for (int remaining = kRetryDelaySeconds; remaining > 0 && !gShutdownFlag; --remaining) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    logger_.logMessage("Bot shutting down gracefully");
}

std::expected<size_t, std::string> RelayBot::pollOnce() {
    auto updates = api_.getUpdates(offset_, telegram_.pollTimeout);
    if (!updates) {
        return std::unexpected(updates.error());
    }
    if (!updates->isArray()) {
        return std::unexpected(std::string("getUpdates returned a non-array result"));
    }

    size_t count = 0;
    for (const auto& update : *updates) {
        std::int64_t updateId = update.isObject() ? update.get("update_id", 0).asInt64() : 0;
        if (updateId >= offset_) {
            offset_ = updateId + 1;
        }
        handleUpdate(update);
        ++count;
        if (gShutdownFlag) {
            break;
        }
    }
    return count;
}

void RelayBot::handleUpdate(const Json::Value& update) {
    try {
        if (update.isMember("message")) {
            handleMessage(update["message"]);
        }
    } catch (const std::exception& e) {
        logger_.logError(std::string("Error handling update: ") + e.what());
    }
}

void RelayBot::handleMessage(const Json::Value& message) {
    const Json::Value& from = message["from"];
    std::int64_t userId = from.get("id", 0).asInt64();
    std::int64_t chatId = message["chat"].get("id", 0).asInt64();
    std::string text = message.get("text", "").asString();

    if (!text.empty() && text[0] == '/') {
        std::string command = commandName(text);
        if (!isKnownCommand(command)) {
            return;
        }
        if (!isAuthorized(userId)) {
            reply(chatId, kUnauthorizedText);
            logger_.logWarning("Unauthorized access attempt from user " + std::to_string(userId));
            return;
        }
        handleCommand(chatId, command, from);
        return;
    }

    auto file = extractInboundFile(message);
    if (file) {
        if (!isAuthorized(userId)) {
            reply(chatId, kUnauthorizedText);
            logger_.logWarning("Unauthorized file from user " + std::to_string(userId));
            return;
        }
        processFile(chatId, *file);
        return;
    }

    if (isForwarded(message)) {
        reply(chatId, isAuthorized(userId) ? kNoForwardedFilesText : kUnauthorizedText);
        return;
    }
    if (message.isMember("caption") && isAuthorized(userId)) {
        reply(chatId, kNoFilesText);
    }
}

void RelayBot::handleCommand(std::int64_t chatId, const std::string& command, const Json::Value& from) {
    if (command == "/start") {
        reply(chatId, "Hi " + from.get("first_name", "there").asString() +
                      "! I'm your backup bot. Use /help to see available commands.");
    } else if (command == "/help") {
        reply(chatId, kHelpText);
    } else if (command == "/status") {
        reply(chatId, statusText());
    }
}

std::string RelayBot::statusText() {
    const ShareConfig& share = sessions_.config();
    auto session = sessions_.tryOpen();
    if (!session) {
        return "✅ Bot is operational\n"
               "❌ SMB connection failed\n"
               "Please check your SMB server settings.";
    }
    (*session)->close();

    std::string server = share.server();
    if (!share.serverName().empty()) {
        server += " (" + share.serverName() + ")";
    }
    return "✅ Bot is operational\n"
           "✅ SMB connection successful\n"
           "Server: " + server + "\n"
           "Share: " + share.share() + "\n"
           "Backup directory: " + share.backupDirectory();
}

void RelayBot::processFile(std::int64_t chatId, const InboundFile& file) {
    std::string name = file.suggestedName();
    logger_.logMessage("Received " + std::string(toString(file.kind)) + " " + name);
    auto statusId = reply(chatId, "Processing " + name + "...");

    auto tempFile = makeTemporaryFile();
    if (!tempFile) {
        logger_.logError("Error processing file " + name + ": " + tempFile.error());
        reply(chatId, "Error processing file: " + tempFile.error());
        return;
    }

    auto filePath = api_.getFilePath(file.fileId);
    std::expected<void, std::string> downloaded = filePath
        ? api_.downloadFile(*filePath, *tempFile)
        : std::expected<void, std::string>(std::unexpected(filePath.error()));
    if (!downloaded) {
        std::error_code ec;
        fs::remove(*tempFile, ec);
        logger_.logError("Error processing file " + name + ": " + downloaded.error());
        reply(chatId, "Error processing file: " + downloaded.error());
        return;
    }

    updateStatus(chatId, statusId, "Backing up " + name + "...");
    TransferOutcome outcome = engine_.backup(TransferRequest{*tempFile, name});

    std::error_code ec;
    fs::remove(*tempFile, ec);
    if (ec) {
        logger_.logWarning("Could not remove temporary file " + *tempFile + ": " + ec.message());
    }

    if (outcome) {
        updateStatus(chatId, statusId, "✅ Successfully backed up " + name + " to " + outcome.remotePath);
    } else {
        updateStatus(chatId, statusId, "❌ Failed to back up " + name);
    }
}

std::optional<std::int64_t> RelayBot::reply(std::int64_t chatId, const std::string& text) {
    auto sent = api_.sendMessage(chatId, text);
    if (!sent) {
        logger_.logError("Failed to send message to chat " + std::to_string(chatId) + ": " + sent.error());
        return std::nullopt;
    }
    return *sent;
}

void RelayBot::updateStatus(std::int64_t chatId, const std::optional<std::int64_t>& messageId, const std::string& text) {
    if (!messageId) {
        reply(chatId, text);
        return;
    }
    auto edited = api_.editMessageText(chatId, *messageId, text);
    if (!edited) {
        logger_.logError("Failed to update status message: " + edited.error());
    }
}

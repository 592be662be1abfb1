#include "relay_api.hpp"
#include "logger.hpp"
#include "relay_bot.hpp"
#include "relay_config.hpp"
#include "smb2_share.hpp"
#include "telegram_api.hpp"
#include "transfer_engine.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::expected<std::string, std::string> RelayAPI::backupFile(const std::string& configFile,
                                                             const std::string& localPath,
                                                             const std::string& filename) {
    try {
        RelayConfig config(configFile);
        Logger logger(config.logFile, config.errorLogFile);
        Smb2Connector connector;
        SessionManager sessions(config.share, connector, logger);
        TransferEngine engine(sessions, logger);

        std::string name = filename.empty() ? fs::path(localPath).filename().string() : filename;
        TransferOutcome outcome = engine.backup(TransferRequest{localPath, name});
        if (!outcome) {
            return std::unexpected("Failed to back up " + name + ": " + outcome.diagnostic);
        }
        return outcome.remotePath;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to start backup: ") + e.what());
    }
}

std::expected<std::string, std::string> RelayAPI::checkStatus(const std::string& configFile) {
    try {
        RelayConfig config(configFile);
        Logger logger(config.logFile, config.errorLogFile);
        Smb2Connector connector;
        SessionManager sessions(config.share, connector, logger);

        auto session = sessions.tryOpen();
        if (!session) {
            return std::unexpected("SMB connection failed: " + session.error().message);
        }
        (*session)->close();
        return "SMB connection successful: //" + config.share.server() + ":" + std::to_string(config.share.port()) +
               "/" + config.share.share() + ", backup directory " + config.share.backupDirectory();
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to check status: ") + e.what());
    }
}

std::expected<void, std::string> RelayAPI::runBot(const std::string& configFile) {
    try {
        RelayConfig config(configFile);
        if (config.telegram.botToken.empty()) {
            return std::unexpected(std::string("No bot token found. Set the TELEGRAM_BOT_TOKEN environment variable."));
        }
        Logger logger(config.logFile, config.errorLogFile);
        Smb2Connector connector;
        SessionManager sessions(config.share, connector, logger);
        TransferEngine engine(sessions, logger);
        CurlTelegramApi api(config.telegram.botToken);

        RelayBot bot(config.telegram, api, sessions, engine, logger);
        bot.run();
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to start bot: ") + e.what());
    }
}

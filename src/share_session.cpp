#include "share_session.hpp"
#include "logger.hpp"
#include <exception>

SessionManager::SessionManager(const ShareConfig& config, ShareConnector& connector, const Logger& logger)
    : config_(config), connector_(connector), logger_(logger) {}

std::unique_ptr<ShareSession> SessionManager::open() {
    auto session = tryOpen();
    if (!session) {
        return nullptr;
    }
    return std::move(*session);
}

std::expected<std::unique_ptr<ShareSession>, TransferError> SessionManager::tryOpen() {
    TransferError error{TransferErrorKind::Connection, ""};
    try {
        auto session = connector_.connect(config_);
        if (session && *session) {
            return session;
        }
        error.message = session ? "connector returned no session" : session.error().message;
    } catch (const std::exception& e) {
        error.message = e.what();
    }

    logger_.logError("Failed to connect to SMB server " + config_.server() + ":" +
                     std::to_string(config_.port()) + " (share " + config_.share() + "): " + error.message);
    return std::unexpected(error);
}

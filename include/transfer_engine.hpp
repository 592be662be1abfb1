/**
 * @file transfer_engine.hpp
 * @brief Relays a local file to the configured share without overwriting existing objects.
 *
 * The transfer engine opens a fresh session per call, makes sure the backup directory exists,
 * picks a collision-free remote name, streams the file, and closes the session on every path.
 * All failures are reported through the returned outcome and the log; nothing is thrown to the
 * caller.
 */

#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include "relay_config.hpp"
#include "share_session.hpp"
#include "transfer_error.hpp"

class Logger;

/**
 * @brief One file to relay.
 */
struct TransferRequest {
    std::string localPath;       ///< Readable regular file on the local disk.
    std::string desiredFilename; ///< Name to store the file under; may contain an extension.
};

/**
 * @brief Result of a transfer.
 */
struct TransferOutcome {
    bool success = false;
    std::string remotePath;                    ///< Final path on the share when successful.
    std::optional<TransferErrorKind> errorKind; ///< Set when the transfer failed.
    std::string diagnostic;                    ///< Human-readable failure reason.

    explicit operator bool() const { return success; }
};

/**
 * @brief Formats a collision suffix "_YYYYMMDD_HHMMSS" in local time.
 *
 * @param when Time to format.
 * @return std::string The suffix, including the leading underscore.
 */
std::string timestampSuffix(std::chrono::system_clock::time_point when);

/**
 * @brief Inserts a suffix before the last '.'-delimited extension of a filename.
 *
 * "report.pdf" + "_x" gives "report_x.pdf", "archive.tar.gz" gives "archive.tar_x.gz",
 * and a name without '.' gets the suffix appended ("notes_x").
 */
std::string insertSuffix(const std::string& filename, const std::string& suffix);

/**
 * @brief Joins a share directory and a filename with exactly one '/'.
 *
 * Trailing separators on the directory are dropped, so "/" + "a.txt" gives "/a.txt".
 */
std::string joinRemotePath(const std::string& directory, const std::string& filename);

/**
 * @brief Relays files to the share configured in a ShareConfig.
 */
class TransferEngine {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Constructs a transfer engine.
     *
     * @param sessions Session manager used to open one session per transfer. Its share
     *                 settings also supply the backup directory and probe-failure policy.
     * @param logger Log sink.
     * @param clock Time source for collision suffixes; defaults to the system clock.
     */
    TransferEngine(SessionManager& sessions, const Logger& logger, Clock clock = {});

    /**
     * @brief Relays one file to the share.
     *
     * @param request Local file and desired remote name.
     * @return TransferOutcome Success with the final remote path, or the failure cause.
     */
    TransferOutcome backup(const TransferRequest& request);

    /**
     * @brief Relays one file to the share and reports only whether it worked.
     */
    bool backupFile(const std::string& localPath, const std::string& desiredFilename);

private:
    std::expected<std::string, TransferError> resolveTargetPath(ShareSession& session, const std::string& filename);
    std::expected<void, TransferError> upload(ShareSession& session, const std::string& localPath, const std::string& remotePath);
    TransferOutcome fail(const TransferError& error);

    const ShareConfig& config() const { return sessions_.config(); }

    SessionManager& sessions_;
    const Logger& logger_;
    Clock clock_;
};

#endif // TRANSFER_ENGINE_HPP

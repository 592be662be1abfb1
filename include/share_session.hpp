/**
 * @file share_session.hpp
 * @brief Session abstraction over a remote file share.
 *
 * Provides the session and connector interfaces the transfer engine works against, and the
 * session manager that opens one fresh, authenticated session per transfer. Concrete backends
 * (libsmb2 in production, an in-memory share in tests) implement the interfaces.
 */

#ifndef SHARE_SESSION_HPP
#define SHARE_SESSION_HPP

#include <cstdint>
#include <expected>
#include <istream>
#include <memory>
#include <string>
#include "relay_config.hpp"
#include "transfer_error.hpp"

class Logger;

/**
 * @brief Outcome of an existence probe.
 */
enum class ProbeStatus {
    Exists,      ///< An object is present at the path.
    NotExists,   ///< The server reported that nothing is at the path.
    ProbeFailed  ///< The probe itself failed; presence is unknown.
};

/**
 * @brief Probe status plus the server's diagnostic when the probe failed.
 */
struct ProbeResult {
    ProbeStatus status;
    std::string detail; ///< Empty unless status is ProbeFailed.
};

/**
 * @brief An open, authenticated handle to a share.
 *
 * Paths are absolute within the share and use '/' separators ("/backups/report.pdf").
 * A session is owned by exactly one transfer call and must be closed before that call returns.
 * Implementations make close() idempotent and close a still-open session on destruction.
 */
class ShareSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ShareSession() = default;

    /**
     * @brief Creates a directory on the share.
     *
     * @param path Directory path within the share.
     * @return std::expected<void, TransferError> Success or a Directory error.
     */
    virtual std::expected<void, TransferError> createDirectory(const std::string& path) = 0;

    /**
     * @brief Checks whether an object exists at a path.
     *
     * @param path Path within the share.
     * @return ProbeResult Exists, NotExists or ProbeFailed.
     */
    virtual ProbeResult probe(const std::string& path) = 0;

    /**
     * @brief Streams the whole of a source stream to a file on the share.
     *
     * Creates the remote file, truncating any existing object at the path.
     *
     * @param path Destination path within the share.
     * @param source Binary input stream, read to its end.
     * @return std::expected<std::uint64_t, TransferError> Number of bytes written or an Upload error.
     */
    virtual std::expected<std::uint64_t, TransferError> storeFile(const std::string& path, std::istream& source) = 0;

    /**
     * @brief Closes the session. Further calls are no-ops.
     */
    virtual void close() = 0;

    /**
     * @brief Returns true until close() has been called.
     */
    virtual bool isOpen() const = 0;
};

/**
 * @brief Opens sessions against a share.
 */
class ShareConnector {
public:
    virtual ~ShareConnector() = default;

    /**
     * @brief Performs the handshake and authentication for one new session.
     *
     * @param config Share settings.
     * @return std::expected<std::unique_ptr<ShareSession>, TransferError> An open session or a Connection error.
     */
    virtual std::expected<std::unique_ptr<ShareSession>, TransferError> connect(const ShareConfig& config) = 0;
};

/**
 * @brief Opens one fresh session per call and reports failures through the log.
 *
 * No session is cached or reused and no retry is attempted.
 */
class SessionManager {
public:
    /**
     * @brief Constructs a session manager.
     *
     * @param config Share settings; must outlive the manager.
     * @param connector Backend used to open sessions; must outlive the manager.
     * @param logger Log sink; must outlive the manager.
     */
    SessionManager(const ShareConfig& config, ShareConnector& connector, const Logger& logger);

    /**
     * @brief Opens an authenticated session.
     *
     * @return std::unique_ptr<ShareSession> The session, or nullptr after logging the failure.
     */
    std::unique_ptr<ShareSession> open();

    /**
     * @brief Opens an authenticated session, returning the failure to the caller as well.
     *
     * @return std::expected<std::unique_ptr<ShareSession>, TransferError> The session or the logged error.
     */
    std::expected<std::unique_ptr<ShareSession>, TransferError> tryOpen();

    const ShareConfig& config() const { return config_; }

private:
    const ShareConfig& config_;
    ShareConnector& connector_;
    const Logger& logger_;
};

#endif // SHARE_SESSION_HPP

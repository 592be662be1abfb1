/**
 * @file smb2_share.hpp
 * @brief SMB2/SMB3 share backend for SmbRelay.
 *
 * Implements the share session and connector interfaces on top of libsmb2, authenticating with
 * NTLMv2 (NTLMSSP) over direct TCP.
 *
 * @note Requires libsmb2. Install via your package manager (libsmb2-dev on Debian/Ubuntu,
 * libsmb2 on Homebrew).
 */

#ifndef SMB2_SHARE_HPP
#define SMB2_SHARE_HPP

#include <string>
#include "share_session.hpp"

struct smb2_context;

/**
 * @brief A connected libsmb2 context bound to one share.
 */
class Smb2Session : public ShareSession {
public:
    /**
     * @brief Takes ownership of a connected context.
     *
     * @param context Context on which smb2_connect_share() succeeded.
     */
    explicit Smb2Session(smb2_context* context);
    ~Smb2Session() override;

    Smb2Session(const Smb2Session&) = delete;
    Smb2Session& operator=(const Smb2Session&) = delete;

    std::expected<void, TransferError> createDirectory(const std::string& path) override;
    ProbeResult probe(const std::string& path) override;
    std::expected<std::uint64_t, TransferError> storeFile(const std::string& path, std::istream& source) override;
    void close() override;
    bool isOpen() const override { return context_ != nullptr; }

    /**
     * @brief Converts a share path to the form libsmb2 expects.
     *
     * Leading and trailing separators are stripped; the share root becomes an empty string.
     *
     * @param path Path such as "/backups/report.pdf".
     * @return std::string Path such as "backups/report.pdf".
     */
    static std::string toSmbPath(const std::string& path);

private:
    std::string lastError() const;

    smb2_context* context_; ///< libsmb2 context; nullptr once closed.
};

/**
 * @brief Opens libsmb2 sessions.
 *
 * Each call creates a new context, authenticates with NTLMv2 using the configured credentials and
 * client name, and connects to the configured share.
 */
class Smb2Connector : public ShareConnector {
public:
    std::expected<std::unique_ptr<ShareSession>, TransferError> connect(const ShareConfig& config) override;
};

#endif // SMB2_SHARE_HPP

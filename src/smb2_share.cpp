#include "smb2_share.hpp"
#include <smb2/smb2.h>
#include <smb2/libsmb2.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <vector>

Smb2Session::Smb2Session(smb2_context* context) : context_(context) {}

Smb2Session::~Smb2Session() {
    close();
}

std::string Smb2Session::toSmbPath(const std::string& path) {
    auto first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return "";
    }
    auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

std::string Smb2Session::lastError() const {
    const char* message = context_ ? smb2_get_error(context_) : nullptr;
    return (message && *message) ? message : "unknown SMB error";
}

std::expected<void, TransferError> Smb2Session::createDirectory(const std::string& path) {
    if (!context_) {
        return std::unexpected(TransferError{TransferErrorKind::Directory, "session is closed"});
    }
    std::string smbPath = toSmbPath(path);
    if (smbPath.empty()) {
        return std::unexpected(TransferError{TransferErrorKind::Directory, "share root always exists"});
    }
    int rc = smb2_mkdir(context_, smbPath.c_str());
    if (rc < 0) {
        return std::unexpected(TransferError{TransferErrorKind::Directory,
                                             "smb2_mkdir " + path + " failed: " + lastError()});
    }
    return {};
}

ProbeResult Smb2Session::probe(const std::string& path) {
    if (!context_) {
        return {ProbeStatus::ProbeFailed, "session is closed"};
    }
    struct smb2_stat_64 st;
    std::memset(&st, 0, sizeof(st));
    int rc = smb2_stat(context_, toSmbPath(path).c_str(), &st);
    if (rc == 0) {
        return {ProbeStatus::Exists, ""};
    }
    if (rc == -ENOENT) {
        return {ProbeStatus::NotExists, ""};
    }
    return {ProbeStatus::ProbeFailed, "smb2_stat " + path + " failed: " + lastError()};
}

std::expected<std::uint64_t, TransferError> Smb2Session::storeFile(const std::string& path, std::istream& source) {
    if (!context_) {
        return std::unexpected(TransferError{TransferErrorKind::Upload, "session is closed"});
    }
    std::string smbPath = toSmbPath(path);
    struct smb2fh* fh = smb2_open(context_, smbPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC);
    if (!fh) {
        return std::unexpected(TransferError{TransferErrorKind::Upload,
                                             "Failed to open remote file " + path + ": " + lastError()});
    }

    std::uint32_t chunk = std::min<std::uint32_t>(smb2_get_max_write_size(context_), 1024 * 1024);
    if (chunk == 0) {
        chunk = 64 * 1024;
    }
    std::vector<std::uint8_t> buf(chunk);
    std::uint64_t total = 0;

    while (source) {
        source.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        auto count = static_cast<std::uint32_t>(source.gcount());
        std::uint32_t offset = 0;
        while (offset < count) {
            int written = smb2_write(context_, fh, buf.data() + offset, count - offset);
            if (written <= 0) {
                std::string message = "Write to " + path + " failed: " + lastError();
                smb2_close(context_, fh);
                return std::unexpected(TransferError{TransferErrorKind::Upload, message});
            }
            offset += static_cast<std::uint32_t>(written);
        }
        total += count;
    }

    if (source.bad()) {
        smb2_close(context_, fh);
        return std::unexpected(TransferError{TransferErrorKind::Upload, "Failed reading local file for " + path});
    }

    if (smb2_close(context_, fh) < 0) {
        return std::unexpected(TransferError{TransferErrorKind::Upload,
                                             "Failed to close remote file " + path + ": " + lastError()});
    }
    return total;
}

void Smb2Session::close() {
    if (!context_) {
        return;
    }
    smb2_disconnect_share(context_);
    smb2_destroy_context(context_);
    context_ = nullptr;
}

std::expected<std::unique_ptr<ShareSession>, TransferError> Smb2Connector::connect(const ShareConfig& config) {
    smb2_context* context = smb2_init_context();
    if (!context) {
        return std::unexpected(TransferError{TransferErrorKind::Connection, "Failed to create SMB2 context"});
    }

    smb2_set_authentication(context, SMB2_SEC_NTLMSSP);
    smb2_set_security_mode(context, SMB2_NEGOTIATE_SIGNING_ENABLED);
    smb2_set_user(context, config.username().c_str());
    smb2_set_password(context, config.password().c_str());
    smb2_set_workstation(context, config.clientName().c_str());
    if (config.timeoutSeconds() > 0) {
        smb2_set_timeout(context, config.timeoutSeconds());
    }

    std::string server = config.server() + ":" + std::to_string(config.port());
    if (smb2_connect_share(context, server.c_str(), config.share().c_str(), config.username().c_str()) < 0) {
        const char* error = smb2_get_error(context);
        std::string message = (error && *error) ? error : "unknown SMB error";
        smb2_destroy_context(context);
        return std::unexpected(TransferError{TransferErrorKind::Connection,
                                             "Failed to connect to //" + server + "/" + config.share() + ": " + message});
    }

    return std::make_unique<Smb2Session>(context);
}

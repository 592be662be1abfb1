#include "transfer_engine.hpp"
#include "logger.hpp"
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Second and later collisions within the same second get "_2", "_3", ... after the timestamp.
constexpr int kMaxCollisionAttempts = 1000;

bool isValidFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find_first_of("/\\") == std::string::npos;
}

} // namespace

std::string timestampSuffix(std::chrono::system_clock::time_point when) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&timeT, &local);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "_%Y%m%d_%H%M%S", &local);
    return timestampBuf;
}

std::string insertSuffix(const std::string& filename, const std::string& suffix) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return filename + suffix;
    }
    return filename.substr(0, dot) + suffix + filename.substr(dot);
}

std::string joinRemotePath(const std::string& directory, const std::string& filename) {
    auto end = directory.find_last_not_of('/');
    std::string base = end == std::string::npos ? "" : directory.substr(0, end + 1);
    return base + "/" + filename;
}

TransferEngine::TransferEngine(SessionManager& sessions, const Logger& logger, Clock clock)
    : sessions_(sessions), logger_(logger), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool TransferEngine::backupFile(const std::string& localPath, const std::string& desiredFilename) {
    return backup(TransferRequest{localPath, desiredFilename}).success;
}

TransferOutcome TransferEngine::backup(const TransferRequest& request) {
    if (!isValidFilename(request.desiredFilename)) {
        return fail({TransferErrorKind::InvalidRequest, "Invalid remote filename: '" + request.desiredFilename + "'"});
    }

    auto session = sessions_.tryOpen();
    if (!session) {
        return fail(session.error());
    }
    ShareSession& share = **session;

    TransferOutcome outcome;
    try {
        auto created = share.createDirectory(config().backupDirectory());
        if (!created) {
            logger_.logWarning("Could not create " + config().backupDirectory() +
                               " (it may already exist): " + created.error().message);
        }

        auto target = resolveTargetPath(share, request.desiredFilename);
        if (!target) {
            share.close();
            return fail(target.error());
        }

        auto uploaded = upload(share, request.localPath, *target);
        if (!uploaded) {
            share.close();
            return fail(uploaded.error());
        }

        outcome.success = true;
        outcome.remotePath = *target;
    } catch (const std::exception& e) {
        share.close();
        return fail({TransferErrorKind::Upload, std::string("Error backing up file: ") + e.what()});
    }

    logger_.logMessage("Successfully backed up file to " + outcome.remotePath);
    share.close();
    return outcome;
}

std::expected<std::string, TransferError> TransferEngine::resolveTargetPath(ShareSession& session,
                                                                          const std::string& filename) {
    std::string candidate = joinRemotePath(config().backupDirectory(), filename);
    ProbeResult probe = session.probe(candidate);

    if (probe.status == ProbeStatus::NotExists) {
        return candidate;
    }
    if (probe.status == ProbeStatus::ProbeFailed) {
        if (config().probeFailurePolicy() == ProbeFailurePolicy::Abort) {
            return std::unexpected(TransferError{TransferErrorKind::ExistenceCheck,
                                                 "Could not check " + candidate + ": " + probe.detail});
        }
        logger_.logWarning("Existence check for " + candidate + " failed, assuming it is absent: " + probe.detail);
        return candidate;
    }

    std::string suffix = timestampSuffix(clock_());
    for (int attempt = 1; attempt <= kMaxCollisionAttempts; ++attempt) {
        std::string renamed = insertSuffix(filename, attempt == 1 ? suffix : suffix + "_" + std::to_string(attempt));
        std::string path = joinRemotePath(config().backupDirectory(), renamed);
        probe = session.probe(path);
        if (probe.status == ProbeStatus::Exists) {
            continue;
        }
        if (probe.status == ProbeStatus::ProbeFailed) {
            if (config().probeFailurePolicy() == ProbeFailurePolicy::Abort) {
                return std::unexpected(TransferError{TransferErrorKind::ExistenceCheck,
                                                     "Could not check " + path + ": " + probe.detail});
            }
            logger_.logWarning("Existence check for " + path + " failed, assuming it is absent: " + probe.detail);
        }
        logger_.logMessage(candidate + " already exists, storing as " + path);
        return path;
    }
    return std::unexpected(TransferError{TransferErrorKind::ExistenceCheck,
                                         "No free name found for " + candidate});
}

std::expected<void, TransferError> TransferEngine::upload(ShareSession& session,
                                                          const std::string& localPath,
                                                          const std::string& remotePath) {
    std::error_code ec;
    if (!fs::is_regular_file(localPath, ec)) {
        return std::unexpected(TransferError{TransferErrorKind::Upload, "Not a readable regular file: " + localPath});
    }
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return std::unexpected(TransferError{TransferErrorKind::Upload, "Failed to open local file: " + localPath});
    }

    auto stored = session.storeFile(remotePath, input);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return {};
}

TransferOutcome TransferEngine::fail(const TransferError& error) {
    logger_.logError("Error backing up file: " + describe(error));
    TransferOutcome outcome;
    outcome.errorKind = error.kind;
    outcome.diagnostic = error.message;
    return outcome;
}

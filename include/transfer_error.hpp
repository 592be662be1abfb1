/**
 * @file transfer_error.hpp
 * @brief Error values produced by the remote transfer layer.
 */

#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <string>

/**
 * @brief Cause of a transfer-layer failure.
 */
enum class TransferErrorKind {
    Configuration,   ///< A mandatory setting is missing or malformed.
    Connection,      ///< Handshake, authentication or transport failure while opening a session.
    Directory,       ///< The backup directory could not be created.
    ExistenceCheck,  ///< Probing the target path failed.
    Upload,          ///< Streaming bytes to the remote path failed.
    InvalidRequest   ///< The transfer request itself is malformed.
};

/**
 * @brief An error kind plus a human-readable message.
 */
struct TransferError {
    TransferErrorKind kind;
    std::string message;
};

/**
 * @brief Returns a short name for an error kind ("connection", "upload", ...).
 */
const char* toString(TransferErrorKind kind);

/**
 * @brief Formats an error as "<kind> error: <message>".
 */
std::string describe(const TransferError& error);

#endif // TRANSFER_ERROR_HPP

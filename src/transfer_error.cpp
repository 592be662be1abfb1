#include "transfer_error.hpp"

const char* toString(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::Configuration:
        return "configuration";
    case TransferErrorKind::Connection:
        return "connection";
    case TransferErrorKind::Directory:
        return "directory";
    case TransferErrorKind::ExistenceCheck:
        return "existence check";
    case TransferErrorKind::Upload:
        return "upload";
    case TransferErrorKind::InvalidRequest:
        return "invalid request";
    }
    return "unknown";
}

std::string describe(const TransferError& error) {
    return std::string(toString(error.kind)) + " error: " + error.message;
}

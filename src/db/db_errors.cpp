// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }
    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }
    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }
    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }
    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }
    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }
    return DBErrorType::UNKNOWN;
}

bool IsRecoverableError(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
        case DBErrorType::NOT_FOUND:
            return true;

        case DBErrorType::CORRUPTION:
        case DBErrorType::IO_ERROR:
        case DBErrorType::INVALID_ARGUMENT:
        case DBErrorType::NOT_SUPPORTED:
        case DBErrorType::UNKNOWN:
            return false;
    }
    return false;
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
            return "Success";
        case DBErrorType::CORRUPTION:
            return "Registry database corruption detected: " + status.ToString() +
                   " (restore from backup)";
        case DBErrorType::IO_ERROR:
            return "I/O error: " + status.ToString() + " (check disk space and permissions)";
        case DBErrorType::NOT_FOUND:
            return "Key not found";
        case DBErrorType::INVALID_ARGUMENT:
            return "Invalid argument: " + status.ToString();
        case DBErrorType::NOT_SUPPORTED:
            return "Operation not supported: " + status.ToString();
        case DBErrorType::UNKNOWN:
            break;
    }
    return "Unknown database error: " + status.ToString();
}

// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_DB_DB_ERRORS_H
#define SEEDLINE_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Database error classification
 *
 * Maps LevelDB statuses onto a small set of classes so callers can
 * tell a missing key apart from corruption or a disk problem.
 */

enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // Disk full, permission denied, lock held
    NOT_FOUND,             // Key not found (normal for some reads)
    INVALID_ARGUMENT,
    NOT_SUPPORTED,
    UNKNOWN
};

DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Check if error is recoverable
 *
 * @return true only for OK and NOT_FOUND
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 * @return Message suitable for logs and tool output
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

#endif // SEEDLINE_DB_DB_ERRORS_H

#pragma once

#include <string>

namespace immich {

/**
 * @brief Failure categories reported by the client
 *
 * Per-asset failures (InvalidAsset, Transport, Auth, Protocol, Status) travel
 * inside UploadOutcome. Structural failures (InvalidConfig, Engine, InvalidUrl)
 * are returned from the entry points themselves.
 */
enum class ErrorCode {
    InvalidAsset,   // Local path is not an uploadable file
    Transport,      // Connectivity, DNS or timeout failure
    Auth,           // Credential rejected or expired
    Protocol,       // Malformed or unexpected server response
    Status,         // Server answered with an unexpected HTTP status
    InvalidConfig,  // Caller supplied an unusable parameter
    Engine,         // Result sink became unusable mid-batch
    InvalidUrl,     // Base URL is not http(s)
    InvalidId,      // Remote id is not a well-formed UUID
    InvalidDate,    // Calendar date/time out of range
    InvalidArchive, // Takeout archive or one of its entries is unreadable
    Internal        // Uploader threw instead of returning an outcome
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    int http_status = 0;     ///< Populated for Status and Auth errors
    std::string subject;     ///< Path or asset id the error refers to, if any

    /**
     * @brief Human readable one-liner, e.g. "Status [500]: internal error"
     */
    std::string to_string() const;
};

const char* error_code_name(ErrorCode code);

Error make_error(ErrorCode code, std::string message, std::string subject = {});

Error make_status_error(int http_status, std::string body);

} // namespace immich

#include "immich/core/error.hpp"

#include <sstream>

namespace immich {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidAsset: return "InvalidAsset";
        case ErrorCode::Transport: return "Transport";
        case ErrorCode::Auth: return "Auth";
        case ErrorCode::Protocol: return "Protocol";
        case ErrorCode::Status: return "Status";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::Engine: return "Engine";
        case ErrorCode::InvalidUrl: return "InvalidUrl";
        case ErrorCode::InvalidId: return "InvalidId";
        case ErrorCode::InvalidDate: return "InvalidDate";
        case ErrorCode::InvalidArchive: return "InvalidArchive";
        case ErrorCode::Internal: return "Internal";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << error_code_name(code);
    if (http_status != 0) {
        oss << " [" << http_status << "]";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    if (!subject.empty()) {
        oss << " (" << subject << ")";
    }
    return oss.str();
}

Error make_error(ErrorCode code, std::string message, std::string subject) {
    Error error;
    error.code = code;
    error.message = std::move(message);
    error.subject = std::move(subject);
    return error;
}

Error make_status_error(int http_status, std::string body) {
    Error error;
    error.code = (http_status == 401 || http_status == 403) ? ErrorCode::Auth : ErrorCode::Status;
    error.http_status = http_status;
    error.message = std::move(body);
    return error;
}

} // namespace immich

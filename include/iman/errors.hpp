#pragma once

#include <cctype>
#include <string>
#include "iman/util.hpp"

namespace iman {

enum class ErrorCategory {
    None,
    Config,
    Network,
    Http,
    Parse,
    Filesystem,
    Subprocess,
    NotFound,
    Data,
    Unsupported,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigInvalid,
    MissingRequiredField,
    TransportFailure,
    Timeout,
    DnsFailure,
    ConnectFailure,
    HttpStatus,
    HttpNotFound,
    ParseFailure,
    CorruptArchive,
    WriteFailed,
    NoSpace,
    SpawnFailed,
    NonZeroExit,
    InterpreterMissing,
    GameNotFound,
    GameNotInstalled,
    UnsupportedFeature
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;   // short, shown to the user
    std::string detail;        // raw message for the log

    explicit operator bool() const { return category != ErrorCategory::None; }
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Network: return "Network";
        case ErrorCategory::Http: return "HTTP";
        case ErrorCategory::Parse: return "Parse";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Subprocess: return "Subprocess";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::Data: return "Data";
        case ErrorCategory::Unsupported: return "Unsupported";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

inline const char* defaultUserMessage(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Config: return "Configuration error.";
        case ErrorCategory::Network: return "Network error.";
        case ErrorCategory::Http: return "Server returned an error.";
        case ErrorCategory::Parse: return "Received malformed data.";
        case ErrorCategory::Filesystem: return "Storage error.";
        case ErrorCategory::Subprocess: return "Failed to run the interpreter.";
        case ErrorCategory::NotFound: return "Not found.";
        case ErrorCategory::Data: return "Invalid repository data.";
        case ErrorCategory::Unsupported: return "Unsupported feature.";
        case ErrorCategory::Internal: return "Internal application error.";
        case ErrorCategory::None: break;
    }
    return "Unknown error.";
}

// Status from transport messages shaped like "HTTP 503 Service Unavailable".
inline int httpStatusFromMessage(const std::string& msg) {
    const auto pos = msg.find("HTTP ");
    if (pos == std::string::npos || pos + 8 > msg.size()) return 0;
    int code = 0;
    for (size_t i = pos + 5; i < pos + 8; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(msg[i]))) return 0;
        code = code * 10 + (msg[i] - '0');
    }
    if (pos + 8 < msg.size() && std::isdigit(static_cast<unsigned char>(msg[pos + 8]))) return 0;
    return code;
}

inline ErrorInfo makeError(ErrorCategory category, ErrorCode code, const std::string& detail,
                           const std::string& userMessage = std::string()) {
    ErrorInfo out;
    out.category = category;
    out.code = code;
    out.detail = detail;
    out.userMessage = userMessage.empty() ? defaultUserMessage(category) : userMessage;
    out.retryable = category == ErrorCategory::Network;
    return out;
}

// Map a low level transport, storage or parse message onto a category and code.
// The hint is kept when nothing in the message is recognised.
inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    struct Rule {
        const char* needles[6];
        ErrorCategory category;
        ErrorCode code;
        const char* userMessage;
        bool retryable;
    };
    // First match wins; HTTP statuses are checked between the first rule and the rest.
    static const Rule kUnsupported = {{"not supported"},
                                      ErrorCategory::Unsupported, ErrorCode::UnsupportedFeature,
                                      "This feature is not supported.", false};
    static const Rule kRules[] = {
        {{"dns", "resolve"},
         ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true},
        {{"timed out", "timeout"},
         ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true},
        {{"connect failed", "socket", "tls handshake"},
         ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true},
        {{"recv failed", "send failed", "short read", "empty http response", "too many redirects", "transport"},
         ErrorCategory::Network, ErrorCode::TransportFailure, "Network transport failed.", true},
        {{"no space", "not enough free space"},
         ErrorCategory::Filesystem, ErrorCode::NoSpace, "Not enough free disk space.", false},
        {{"write failed", "open failed", "rename failed", "mkdir failed", "remove failed", "read failed"},
         ErrorCategory::Filesystem, ErrorCode::WriteFailed, "Failed to write to storage.", false},
        {{"zip", "archive", "crc"},
         ErrorCategory::Parse, ErrorCode::CorruptArchive, "Game archive is corrupt or unsupported.", false},
        {{"parse", "malformed", "json"},
         ErrorCategory::Parse, ErrorCode::ParseFailure, "Received malformed data.", false},
    };

    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;
    out.httpStatus = httpStatusFromMessage(detail);

    const std::string lower = util::toLower(detail);
    auto matches = [&lower](const Rule& r) {
        for (const char* n : r.needles) {
            if (n && lower.find(n) != std::string::npos) return true;
        }
        return false;
    };
    auto apply = [&out](const Rule& r) {
        out.category = r.category;
        out.code = r.code;
        out.userMessage = r.userMessage;
        out.retryable = r.retryable;
    };

    const int http = out.httpStatus;
    if (matches(kUnsupported)) {
        apply(kUnsupported);
    } else if (http == 404) {
        apply({{}, ErrorCategory::Http, ErrorCode::HttpNotFound, "Requested resource was not found (404).", false});
    } else if (http >= 300 && http < 600) {
        apply({{}, ErrorCategory::Http, ErrorCode::HttpStatus, "Server returned an HTTP error.", http >= 500});
    } else {
        for (const auto& r : kRules) {
            if (matches(r)) {
                apply(r);
                break;
            }
        }
    }

    if (out.category == ErrorCategory::None) out.category = ErrorCategory::Internal;
    if (out.userMessage.empty()) {
        out.userMessage = defaultUserMessage(out.category);
        out.retryable = out.category == ErrorCategory::Network;
    }
    return out;
}

inline std::string describeError(const ErrorInfo& info) {
    std::string out = std::string(errorCategoryLabel(info.category)) + ": " + info.userMessage;
    if (!info.detail.empty() && info.detail != info.userMessage) out += " (" + info.detail + ")";
    return out;
}

} // namespace iman

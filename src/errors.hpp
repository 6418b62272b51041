#pragma once
#include <stdexcept>
#include <string>

// Maelstrom error codes. Values are part of the wire protocol.
enum class ErrorCode : int {
    TIMEOUT                 = 0,
    NODE_NOT_FOUND          = 1,
    NOT_SUPPORTED           = 10,
    TEMPORARILY_UNAVAILABLE = 11,
    MALFORMED_REQUEST       = 12,
    CRASH                   = 13,
    ABORT                   = 14,
    KEY_DOES_NOT_EXIST      = 20,
    KEY_ALREADY_EXISTS      = 21,
    PRECONDITION_FAILED     = 22,
    TXN_CONFLICT            = 30
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::TIMEOUT:                 return "timeout";
        case ErrorCode::NODE_NOT_FOUND:          return "node-not-found";
        case ErrorCode::NOT_SUPPORTED:           return "not-supported";
        case ErrorCode::TEMPORARILY_UNAVAILABLE: return "temporarily-unavailable";
        case ErrorCode::MALFORMED_REQUEST:       return "malformed-request";
        case ErrorCode::CRASH:                   return "crash";
        case ErrorCode::ABORT:                   return "abort";
        case ErrorCode::KEY_DOES_NOT_EXIST:      return "key-does-not-exist";
        case ErrorCode::KEY_ALREADY_EXISTS:      return "key-already-exists";
        case ErrorCode::PRECONDITION_FAILED:     return "precondition-failed";
        case ErrorCode::TXN_CONFLICT:            return "txn-conflict";
        default:                                 return "unknown";
    }
}

// A line that is not a well-formed message envelope.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by handlers; answered with an error reply carrying code() and what().
class RpcError : public std::runtime_error {
public:
    RpcError(ErrorCode code, const std::string& text)
        : std::runtime_error(text), code_(code) {}

    ErrorCode code() const { return code_; }

    static RpcError not_supported(const std::string& text) {
        return RpcError(ErrorCode::NOT_SUPPORTED, text);
    }
    static RpcError malformed_request(const std::string& text) {
        return RpcError(ErrorCode::MALFORMED_REQUEST, text);
    }

private:
    ErrorCode code_;
};

// Not locally recoverable (missing or corrupt handshake). Terminates the process.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {}
};

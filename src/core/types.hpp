#pragma once

#include <string>
#include <optional>
#include <cstdint>

// What went wrong, in terms a caller can branch on.
enum class ErrorKind {
    NONE,
    NETWORK,        // resolve / refuse / timeout
    AUTH,           // credentials rejected
    KEY,            // private key invalid or unreadable
    CREDENTIAL,     // no password or key supplied
    NOT_FOUND,
    NOT_OWNER,
    DUPLICATE,
    OUT_OF_ORDER,   // upload chunk ahead of the expected index
    INVALID_INPUT,
    TOO_LARGE,
    IO,             // local file or channel write failure
    REMOTE,         // SFTP status error from the server
    UNKNOWN,
};

// Short lowercase tag used at the request/response boundary ("network", "auth", ...).
const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::NONE};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::UNKNOWN) {
        return {false, T{}, err, kind};
    }

    // Re-wrap another result's failure with a different value type.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorKind::NONE};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::UNKNOWN) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Connection parameters as they arrive from a client request.
struct ConnectionParams {
    std::string host;
    int port = 22;
    std::string user;
    std::string auth_type = "password";      // "password" or "key"
    std::string password;                    // base64 by convention
    std::string private_key_path;
    std::optional<std::string> passphrase;   // for encrypted private keys
};

struct TerminalSize {
    int cols;
    int rows;
};

inline bool operator==(const TerminalSize& a, const TerminalSize& b) {
    return a.cols == b.cols && a.rows == b.rows;
}

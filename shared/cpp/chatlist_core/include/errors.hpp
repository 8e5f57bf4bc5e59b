#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,
    ProviderInUse,
    MissingCredential,
    NetworkError,
    Timeout,
    InvalidSetting,
    Cancelled,
    Storage,
    InvalidArgument
};

const char* error_kind_name(ErrorKind kind);
bool parse_error_kind(const std::string& name, ErrorKind& out);

class ChatlistError : public std::runtime_error {
public:
    ChatlistError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised for any failing sqlite3 call; code() is the extended result code.
class SqliteError : public ChatlistError {
public:
    SqliteError(int code, const std::string& message)
        : ChatlistError(ErrorKind::Storage, message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

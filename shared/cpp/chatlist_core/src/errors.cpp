#include "../include/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::ProviderInUse: return "ProviderInUse";
    case ErrorKind::MissingCredential: return "MissingCredential";
    case ErrorKind::NetworkError: return "NetworkError";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::InvalidSetting: return "InvalidSetting";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::Storage: return "Storage";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

bool parse_error_kind(const std::string& name, ErrorKind& out) {
    static const ErrorKind all[] = {
        ErrorKind::NotFound, ErrorKind::ProviderInUse, ErrorKind::MissingCredential,
        ErrorKind::NetworkError, ErrorKind::Timeout, ErrorKind::InvalidSetting,
        ErrorKind::Cancelled, ErrorKind::Storage, ErrorKind::InvalidArgument
    };
    for (auto k : all) {
        if (name == error_kind_name(k)) { out = k; return true; }
    }
    return false;
}

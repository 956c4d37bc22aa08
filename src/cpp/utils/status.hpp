#pragma once
// Error taxonomy shared by all components.
// Operations report failure through Status instead of throwing; the kind
// decides whether the failure is local to one file or aborts the run.
#include <string>
#include <utility>

namespace ifx {

enum class ErrorKind {
    NONE,
    CONFIGURATION,  // missing/unreadable config, no run attempted
    CONNECTION,     // DB or FTP endpoint unreachable, nothing mutated
    TRANSFER,       // FTP operation exhausted its retries
    VALIDATION,     // malformed line or field, fatal for the containing file
    PERSISTENCE     // insert/update failed, transaction rolled back
};

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:          return "none";
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::CONNECTION:    return "connection";
        case ErrorKind::TRANSFER:      return "transfer";
        case ErrorKind::VALIDATION:    return "validation";
        case ErrorKind::PERSISTENCE:   return "persistence";
    }
    return "??";
}

struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string error;  // Empty on success

    [[nodiscard]] bool ok() const { return kind == ErrorKind::NONE; }

    static Status success() { return {}; }
    static Status failure(ErrorKind k, std::string msg) {
        Status s;
        s.kind = k;
        s.error = std::move(msg);
        return s;
    }
};

} // namespace ifx

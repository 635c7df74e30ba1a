#pragma once
#include <string>
#include <utility>

namespace batchsync {

// Which stage of a run produced a failure. Per-file and per-group kinds are
// absorbed into the run summary; Config, Submission and Cancelled end the run.
enum class ErrorKind : int {
    None = 0,
    Config,
    Scan,
    Classification,
    Staging,
    Submission,
    Cancelled,
    Io,
};

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::Io};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }

    // Re-tag a failure coming from a lower layer, prefixing context.
    Result As(ErrorKind k, const std::string& context) const {
        if (ok) return *this;
        return {.ok = false, .err = err, .msg = context + ": " + msg, .kind = k};
    }
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "none";
        case ErrorKind::Config:         return "config";
        case ErrorKind::Scan:           return "scan";
        case ErrorKind::Classification: return "classification";
        case ErrorKind::Staging:        return "staging";
        case ErrorKind::Submission:     return "submission";
        case ErrorKind::Cancelled:      return "cancelled";
        case ErrorKind::Io:             return "io";
    }
    return "unknown";
}

} // namespace batchsync

#pragma once

/**
 * DownloadError.hpp
 *
 * Closed error taxonomy for the download engine. Commands throw
 * DownloadError; worker-side failures are captured as ErrorInfo in the
 * task's last_error.
 */

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace ferry::core::downloader {

enum class ErrorKind {
    NotFound,           // Unknown download id
    Invalid,            // Malformed request or illegal state transition
    Source,             // Network / protocol failure surfaced by an adapter
    Io,                 // File system failure
    AlreadyCompleted,
    Integrity           // Final digest mismatch
};

/**
 * Structured error payload stored on a failed task
 */
struct ErrorInfo {
    ErrorKind kind{ErrorKind::Io};
    std::string code;
    std::string message;
    bool recoverable{true};
};

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message,
                  bool recoverable = true, std::string code = "")
        : std::runtime_error(message)
        , m_kind(kind)
        , m_recoverable(recoverable)
        , m_code(code.empty() ? defaultCode(kind) : std::move(code)) {}

    static DownloadError notFound(const std::string& id) {
        return DownloadError(ErrorKind::NotFound, "download not found: " + id, false);
    }

    static DownloadError invalid(const std::string& message) {
        return DownloadError(ErrorKind::Invalid, "invalid request: " + message, false);
    }

    static DownloadError source(const std::string& message, bool recoverable = true) {
        return DownloadError(ErrorKind::Source, "source error: " + message, recoverable);
    }

    static DownloadError io(const std::string& message) {
        return DownloadError(ErrorKind::Io, "io error: " + message, true);
    }

    static DownloadError storageExhausted(uint64_t needed, uint64_t available) {
        return DownloadError(ErrorKind::Io,
            "insufficient disk space: need " + std::to_string(needed) +
            " bytes, have " + std::to_string(available) + " bytes",
            true, "STORAGE_EXHAUSTED");
    }

    static DownloadError alreadyCompleted(const std::string& destination) {
        return DownloadError(ErrorKind::AlreadyCompleted,
            "already completed: " + destination, false);
    }

    static DownloadError integrity(const std::string& expected, const std::string& actual) {
        return DownloadError(ErrorKind::Integrity,
            "digest mismatch: expected " + expected + ", got " + actual, true);
    }

    ErrorKind kind() const { return m_kind; }
    bool recoverable() const { return m_recoverable; }
    const std::string& code() const { return m_code; }

    ErrorInfo info() const {
        return ErrorInfo{m_kind, m_code, what(), m_recoverable};
    }

    static const char* defaultCode(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NotFound:         return "DOWNLOAD_NOT_FOUND";
            case ErrorKind::Invalid:          return "DOWNLOAD_INVALID_REQUEST";
            case ErrorKind::Source:           return "DOWNLOAD_SOURCE_ERROR";
            case ErrorKind::Io:               return "IO_ERROR";
            case ErrorKind::AlreadyCompleted: return "DOWNLOAD_ALREADY_COMPLETE";
            case ErrorKind::Integrity:        return "INTEGRITY_MISMATCH";
        }
        return "IO_ERROR";
    }

private:
    ErrorKind m_kind;
    bool m_recoverable;
    std::string m_code;
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:         return "NotFound";
        case ErrorKind::Invalid:          return "Invalid";
        case ErrorKind::Source:           return "Source";
        case ErrorKind::Io:               return "Io";
        case ErrorKind::AlreadyCompleted: return "AlreadyCompleted";
        case ErrorKind::Integrity:        return "Integrity";
    }
    return "Io";
}

inline void to_json(nlohmann::json& j, const ErrorInfo& error) {
    j = nlohmann::json{
        {"kind", toString(error.kind)},
        {"code", error.code},
        {"message", error.message},
        {"recoverable", error.recoverable}
    };
}

} // namespace ferry::core::downloader

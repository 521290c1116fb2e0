#pragma once

#include <stdexcept>
#include <string>

namespace halbrain {

/**
 * Structured error reporting for halbrain.
 *
 * Empty generation results are not errors and never travel through here;
 * these types cover snapshot format failures, file I/O and bad arguments.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Snapshot format errors
    NOT_A_BRAIN_FILE = 100,
    CHAIN_LENGTH_MISMATCH = 101,
    MALFORMED_SNAPSHOT = 102,

    // I/O errors
    FILE_NOT_FOUND = 300,
    IO_FAILURE = 301,
    UNKNOWN_FORMAT = 302,

    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class HalbrainException : public std::runtime_error {
public:
    explicit HalbrainException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public HalbrainException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : HalbrainException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Raised by snapshot loading. code() tells the three cases apart:
// NOT_A_BRAIN_FILE, CHAIN_LENGTH_MISMATCH and MALFORMED_SNAPSHOT.
class SnapshotFormatError : public HalbrainException {
public:
    SnapshotFormatError(ErrorCode code, const std::string& message,
                        const std::string& context = "")
        : HalbrainException(code, message, context) {}
};

class IOError : public HalbrainException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     ErrorCode code = ErrorCode::IO_FAILURE)
        : HalbrainException(code, message, context) {}
};

class UnknownFormatError : public HalbrainException {
public:
    explicit UnknownFormatError(const std::string& message,
                                const std::string& context = "")
        : HalbrainException(ErrorCode::UNKNOWN_FORMAT, message, context,
                            "use a .txt, .trn or .tagged file") {}
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::NOT_A_BRAIN_FILE: return "not a brain file";
        case ErrorCode::CHAIN_LENGTH_MISMATCH: return "wrong chain length";
        case ErrorCode::MALFORMED_SNAPSHOT: return "invalid brain file";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::IO_FAILURE: return "i/o failure";
        case ErrorCode::UNKNOWN_FORMAT: return "unknown file format";
        case ErrorCode::INTERNAL_ERROR: return "internal error";
    }
    return "unknown error";
}

#define HALBRAIN_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw halbrain::InvalidArgumentError(message, __func__); } while (0)

} // namespace halbrain

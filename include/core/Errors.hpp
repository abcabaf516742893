#pragma once
#include <stdexcept>
#include <string>

namespace ZenFeed {

enum class ErrorCode {
    // Fetch
    Timeout,
    ConnectionRefused,
    HttpStatus,
    TlsError,
    NetworkFailure,
    // Parse
    MalformedDocument,
    UnsupportedDialect,
    // Storage
    ConstraintViolation,
    TransactionFailure,
    IoFailure,
    // Validation
    DuplicateFeedUrl,
    InvalidFeedUrl,
    InvalidCategoryName,
    UnknownFeed,
    UnknownCategory,
    UnknownArticle,
    // Sync pass
    Cancelled
};

const char* errorCodeName(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class FetchError : public Error {
public:
    FetchError(ErrorCode code, const std::string& message, int httpStatus = 0);
    int httpStatus() const noexcept { return httpStatus_; }

    // Timeouts, dropped connections and server-side (5xx, 429) responses.
    bool isTransient() const noexcept;

private:
    int httpStatus_;
};

class ParseError : public Error {
public:
    using Error::Error;
};

class StorageError : public Error {
public:
    using Error::Error;
};

class ValidationError : public Error {
public:
    using Error::Error;
};

}

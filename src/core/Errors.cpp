#include "core/Errors.hpp"

namespace ZenFeed {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ConnectionRefused: return "ConnectionRefused";
        case ErrorCode::HttpStatus: return "HTTPStatus";
        case ErrorCode::TlsError: return "TLSError";
        case ErrorCode::NetworkFailure: return "NetworkFailure";
        case ErrorCode::MalformedDocument: return "MalformedDocument";
        case ErrorCode::UnsupportedDialect: return "UnsupportedDialect";
        case ErrorCode::ConstraintViolation: return "ConstraintViolation";
        case ErrorCode::TransactionFailure: return "TransactionFailure";
        case ErrorCode::IoFailure: return "IOFailure";
        case ErrorCode::DuplicateFeedUrl: return "DuplicateFeedURL";
        case ErrorCode::InvalidFeedUrl: return "InvalidFeedURL";
        case ErrorCode::InvalidCategoryName: return "InvalidCategoryName";
        case ErrorCode::UnknownFeed: return "UnknownFeed";
        case ErrorCode::UnknownCategory: return "UnknownCategory";
        case ErrorCode::UnknownArticle: return "UnknownArticle";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

FetchError::FetchError(ErrorCode code, const std::string& message, int httpStatus)
    : Error(code, message), httpStatus_(httpStatus) {}

bool FetchError::isTransient() const noexcept {
    switch (code()) {
        case ErrorCode::Timeout:
        case ErrorCode::NetworkFailure:
            return true;
        case ErrorCode::HttpStatus:
            return httpStatus_ >= 500 || httpStatus_ == 429;
        default:
            return false;
    }
}

}

#include "core/Types.hpp"

namespace ZenFeed {

const char* syncStateName(SyncState state) {
    switch (state) {
        case SyncState::Pending: return "Pending";
        case SyncState::Fetching: return "Fetching";
        case SyncState::Parsing: return "Parsing";
        case SyncState::Merging: return "Merging";
        case SyncState::Done: return "Done";
        case SyncState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string describeFailure(const SyncFailure& failure) {
    std::string out = errorCodeName(failure.code);
    if (failure.code == ErrorCode::HttpStatus && failure.httpStatus != 0) {
        out += "(" + std::to_string(failure.httpStatus) + ")";
    }
    if (!failure.message.empty()) out += ": " + failure.message;
    return out;
}

}

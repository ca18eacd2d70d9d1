#include "types/DocumentState.hpp"

#include <stdexcept>

namespace dm::types {

std::string to_string(const Lifecycle lifecycle) {
    switch (lifecycle) {
        case Lifecycle::Pending: return "STATE_PENDING";
        case Lifecycle::Active: return "STATE_ACTIVE";
        case Lifecycle::Failed: return "STATE_FAILED";
    }
    throw std::invalid_argument("Unknown lifecycle state");
}

std::string to_string(const Advisory advisory) {
    switch (advisory) {
        case Advisory::MissingMetadata: return "MISSING_METADATA";
        case Advisory::DuplicateFile: return "DUPLICATE_FILE";
        case Advisory::MissingFromRemote: return "MISSING_FROM_REMOTE";
        case Advisory::MetadataMismatch: return "METADATA_MISMATCH";
    }
    throw std::invalid_argument("Unknown advisory state");
}

std::string to_string(const DocumentState& state) {
    if (state.advisory) return to_string(*state.advisory);
    return to_string(state.primary);
}

std::optional<Lifecycle> lifecycleFromString(const std::string& str) {
    if (str == "STATE_PENDING" || str == "STATE_UNSPECIFIED") return Lifecycle::Pending;
    if (str == "STATE_ACTIVE") return Lifecycle::Active;
    if (str == "STATE_FAILED") return Lifecycle::Failed;
    return std::nullopt;
}

std::optional<Advisory> advisoryFromString(const std::string& str) {
    if (str == "MISSING_METADATA") return Advisory::MissingMetadata;
    if (str == "DUPLICATE_FILE") return Advisory::DuplicateFile;
    if (str == "MISSING_FROM_REMOTE") return Advisory::MissingFromRemote;
    if (str == "METADATA_MISMATCH") return Advisory::MetadataMismatch;
    return std::nullopt;
}

DocumentState DocumentState::fromString(const std::string& str, const Lifecycle fallbackPrimary) {
    if (const auto lifecycle = lifecycleFromString(str)) return DocumentState(*lifecycle);
    if (const auto advisory = advisoryFromString(str)) return DocumentState(fallbackPrimary, advisory);
    throw std::invalid_argument("Unknown document state: " + str);
}

int advisoryPriority(const Advisory advisory) {
    switch (advisory) {
        case Advisory::DuplicateFile: return 3;
        case Advisory::MissingMetadata: return 2;
        case Advisory::MetadataMismatch: return 1;
        case Advisory::MissingFromRemote: return 0;
    }
    return 0;
}

}

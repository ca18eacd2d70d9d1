#pragma once

#include <optional>
#include <string>

namespace dm::types {

// Primary upload lifecycle of a document
enum class Lifecycle { Pending, Active, Failed };

// Reconciliation findings layered on top of the lifecycle
enum class Advisory { MissingMetadata, DuplicateFile, MissingFromRemote, MetadataMismatch };

struct DocumentState {
    Lifecycle primary{Lifecycle::Pending};
    std::optional<Advisory> advisory{};

    DocumentState() = default;
    explicit DocumentState(const Lifecycle lifecycle, const std::optional<Advisory> overlay = std::nullopt)
        : primary(lifecycle), advisory(overlay) {}

    // Parses a persisted state name. Advisory names take the supplied lifecycle as primary.
    static DocumentState fromString(const std::string& str, Lifecycle fallbackPrimary = Lifecycle::Pending);

    [[nodiscard]] bool flagged() const { return advisory.has_value(); }

    [[nodiscard]] DocumentState cleared() const { return DocumentState(primary); }

    [[nodiscard]] bool operator==(const DocumentState& other) const = default;
};

std::string to_string(Lifecycle lifecycle);
std::string to_string(Advisory advisory);

// The single persisted name: the overlay when present, otherwise the lifecycle
std::string to_string(const DocumentState& state);

std::optional<Lifecycle> lifecycleFromString(const std::string& str);
std::optional<Advisory> advisoryFromString(const std::string& str);

// Advisory precedence when several findings apply to one document
int advisoryPriority(Advisory advisory);

}

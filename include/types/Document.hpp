#pragma once

#include "types/CustomMetadata.hpp"
#include "types/DocumentState.hpp"

#include <ctime>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace dm::types {

struct Document {
    unsigned int id{}, filestore_id{};
    std::optional<std::string> user{};
    std::string filename{}, url{}, hash{}, display_name{};
    uintmax_t size{0};
    std::optional<std::string> name{};                 // remote resource name, set once uploaded
    std::optional<CustomMetadata> custom_metadata{};
    std::optional<std::time_t> create_time{}, update_time{};
    std::optional<uintmax_t> size_bytes{};
    std::optional<std::string> mime_type{};
    DocumentState state{};
    std::optional<std::string> category{};
    std::string tags{"[]"}, metadata{"{}"};            // raw JSON text
    std::optional<std::time_t> started_at{}, uploaded_at{};
    std::optional<std::string> error{}, ref{};
    std::time_t created_at{}, updated_at{};

    Document() = default;
    explicit Document(const pqxx::row& row);

    [[nodiscard]] bool hasError() const { return error && !error->empty(); }

    // Claimed by an attempt that has not reached a terminal marker
    [[nodiscard]] bool inFlight() const { return started_at && !uploaded_at && !hasError(); }

    // Lifecycle implied by the terminal markers alone
    [[nodiscard]] Lifecycle markerLifecycle() const;

    // "category/displayName", or just displayName when uncategorized
    [[nodiscard]] std::string sampleLabel() const;

    [[nodiscard]] bool operator==(const Document& other) const = default;
};

// Claim and terminal markers of a row as it was read
struct DocumentMarkers {
    std::optional<std::time_t> started_at{}, uploaded_at{};
    std::optional<std::string> error{};

    static DocumentMarkers of(const Document& doc) { return {doc.started_at, doc.uploaded_at, doc.error}; }

    [[nodiscard]] bool operator==(const DocumentMarkers& other) const = default;
};

// A reconciliation write. It lands only while the row still carries the markers it was planned from.
struct DocumentUpdate {
    Document doc;
    DocumentMarkers expected;
};

void to_json(nlohmann::json& j, const Document& d);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Document>>& docs);

std::vector<std::shared_ptr<Document>> documents_from_pq_res(const pqxx::result& res);

}

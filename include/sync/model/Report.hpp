#pragma once

#include "types/Document.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace dm::sync::model {

// One report category: the full count plus a bounded sample of labels
struct Bucket {
    unsigned int count{0};
    std::vector<std::string> docs{};

    void add(const std::string& label, unsigned int sampleSize);

    [[nodiscard]] bool operator==(const Bucket& other) const = default;
};

struct Summary {
    unsigned int local_documents{0}, remote_documents{0}, matched_documents{0};

    [[nodiscard]] bool operator==(const Summary& other) const = default;
};

struct Report {
    Bucket missing_from_local{}, missing_from_remote{}, missing_metadata{},
           metadata_mismatch{}, unmatched_fields{}, duplicate_documents{};
    Summary summary{};

    [[nodiscard]] bool operator==(const Report& other) const = default;
};

// A report and the local rows whose reconciliation columns change
struct Plan {
    Report report{};
    std::vector<types::DocumentUpdate> updates{};
};

void to_json(nlohmann::json& j, const Bucket& b);
void to_json(nlohmann::json& j, const Report& r);

}

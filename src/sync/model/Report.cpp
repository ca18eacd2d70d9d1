#include "sync/model/Report.hpp"

#include <nlohmann/json.hpp>

using namespace dm::sync::model;

void Bucket::add(const std::string& label, const unsigned int sampleSize) {
    ++count;
    if (docs.size() < sampleSize) docs.push_back(label);
}

void dm::sync::model::to_json(nlohmann::json& j, const Bucket& b) {
    j = {{"count", b.count}, {"docs", b.docs}};
}

void dm::sync::model::to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"Missing from Local", r.missing_from_local},
        {"Missing from Gemini", r.missing_from_remote},
        {"Missing Metadata", r.missing_metadata},
        {"Metadata Mismatch", r.metadata_mismatch},
        {"Unmatched Fields", r.unmatched_fields},
        {"Duplicate Documents", r.duplicate_documents},
        {"Summary", {
            {"Local Documents", r.summary.local_documents},
            {"Remote Documents", r.summary.remote_documents},
            {"Matched Documents", r.summary.matched_documents}
        }}
    };
}

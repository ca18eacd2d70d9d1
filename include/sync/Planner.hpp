#pragma once

#include "config/Config.hpp"
#include "db/DocumentRepository.hpp"
#include "remote/model/Document.hpp"
#include "sync/model/Report.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace dm::sync {

// Pure reconciliation of a local snapshot (id ascending) against a remote listing.
// The same inputs always give the same plan.
struct Planner {
    static model::Plan build(const std::vector<db::DocumentPtr>& locals,
                             const std::vector<remote::model::Document>& remotes,
                             const config::SyncConfig& cfg,
                             std::time_t now);

    // "category/displayName" from the remote custom metadata, or just displayName
    static std::string remoteLabel(const remote::model::Document& doc);

    // The metadata keys a remote copy of this document must carry
    static bool hasRequiredMetadata(const types::Document& local, const remote::model::Document& remote);

    static bool metadataAgrees(const types::Document& local, const remote::model::Document& remote);

    static bool fieldsAgree(const types::Document& local, const remote::model::Document& remote);
};

}

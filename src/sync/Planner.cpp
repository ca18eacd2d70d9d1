#include "sync/Planner.hpp"
#include "log/Registry.hpp"

#include <map>
#include <unordered_map>
#include <unordered_set>

using namespace dm::sync;
using namespace dm::sync::model;
using namespace dm::types;
using RemoteDoc = dm::remote::model::Document;

namespace {

const CustomMetadataEntry* remoteEntry(const RemoteDoc& doc, const std::string& key) {
    if (!doc.custom_metadata) return nullptr;
    return findEntry(*doc.custom_metadata, key);
}

struct Pair {
    const Document* local;
    const RemoteDoc* remote;
};

// Keeps the highest-priority finding per document
void flag(std::map<unsigned int, Advisory>& overlays, const unsigned int id, const Advisory advisory) {
    const auto [it, inserted] = overlays.try_emplace(id, advisory);
    if (!inserted && advisoryPriority(advisory) > advisoryPriority(it->second)) it->second = advisory;
}

}

std::string Planner::remoteLabel(const RemoteDoc& doc) {
    if (const auto* category = remoteEntry(doc, "category"); category && category->string_value && !category->string_value->empty())
        return *category->string_value + "/" + doc.display_name;
    return doc.display_name;
}

bool Planner::hasRequiredMetadata(const Document& local, const RemoteDoc& remote) {
    if (!remoteEntry(remote, "id") || !remoteEntry(remote, "hash")) return false;
    if (local.category && !local.category->empty() && !remoteEntry(remote, "category")) return false;
    return true;
}

bool Planner::metadataAgrees(const Document& local, const RemoteDoc& remote) {
    const auto* id = remoteEntry(remote, "id");
    const auto* hash = remoteEntry(remote, "hash");
    return id && hash && id->valueAsString() == std::to_string(local.id) && hash->valueAsString() == local.hash;
}

bool Planner::fieldsAgree(const Document& local, const RemoteDoc& remote) {
    return remote.display_name == local.display_name
        && remote.size_bytes == std::optional<uintmax_t>(local.size)
        && remote.mime_type == local.mime_type;
}

Plan Planner::build(const std::vector<db::DocumentPtr>& locals,
                    const std::vector<RemoteDoc>& remotes,
                    const config::SyncConfig& cfg,
                    const std::time_t now) {
    Plan plan;
    auto& report = plan.report;
    const auto sample = cfg.sample_size;

    std::unordered_map<std::string, const Document*> byHash, byName, byDisplayName;
    for (const auto& doc : locals) {
        byHash.try_emplace(doc->hash, doc.get());
        if (doc->name) byName.try_emplace(*doc->name, doc.get());
        if (cfg.name_tie_break == config::NameTieBreak::Last) byDisplayName[doc->display_name] = doc.get();
        else byDisplayName.try_emplace(doc->display_name, doc.get());
    }

    std::vector<Pair> pairs;
    std::unordered_set<unsigned int> matched, duplicated;
    std::map<unsigned int, Advisory> overlays;

    for (const auto& remote : remotes) {
        const Document* local = nullptr;

        if (const auto* hash = remoteEntry(remote, "hash"); hash && hash->string_value)
            if (const auto it = byHash.find(*hash->string_value); it != byHash.end()) local = it->second;

        if (!local && !remote.name.empty())
            if (const auto it = byName.find(remote.name); it != byName.end()) local = it->second;

        if (!local)
            if (const auto it = byDisplayName.find(remote.display_name); it != byDisplayName.end()) local = it->second;

        if (!local) {
            report.missing_from_local.add(remoteLabel(remote), sample);
            continue;
        }

        if (!matched.insert(local->id).second) {
            if (duplicated.insert(local->id).second) report.duplicate_documents.add(local->sampleLabel(), sample);
            flag(overlays, local->id, Advisory::DuplicateFile);
            log::Registry::sync()->debug("[Planner] {} is a second remote copy of document {}", remote.name, local->id);
            continue;
        }

        pairs.push_back({local, &remote});
    }

    std::unordered_map<unsigned int, const RemoteDoc*> clean;

    for (const auto& [local, remote] : pairs) {
        if (!hasRequiredMetadata(*local, *remote)) {
            report.missing_metadata.add(remoteLabel(*remote), sample);
            flag(overlays, local->id, Advisory::MissingMetadata);
        } else {
            ++report.summary.matched_documents;
            if (!metadataAgrees(*local, *remote)) {
                report.metadata_mismatch.add(remoteLabel(*remote), sample);
                flag(overlays, local->id, Advisory::MetadataMismatch);
            } else clean.emplace(local->id, remote);
        }

        if (!fieldsAgree(*local, *remote)) report.unmatched_fields.add(remoteLabel(*remote), sample);
    }

    for (const auto& doc : locals) {
        if (matched.contains(doc->id)) continue;
        report.missing_from_remote.add(doc->sampleLabel(), sample);
        flag(overlays, doc->id, Advisory::MissingFromRemote);
    }

    report.summary.local_documents = static_cast<unsigned int>(locals.size());
    report.summary.remote_documents = static_cast<unsigned int>(remotes.size());

    for (const auto& doc : locals) {
        Document next = *doc;

        if (const auto it = clean.find(doc->id); it != clean.end()) {
            const auto& remote = *it->second;
            next.name = remote.name;
            next.create_time = remote.create_time;
            next.update_time = remote.update_time;
            next.size_bytes = remote.size_bytes;
            next.custom_metadata = remote.custom_metadata;

            if ((!next.inFlight() && !next.uploaded_at) || next.hasError()) {
                next.uploaded_at = now;
                next.error.reset();
            }
        }

        std::optional<Advisory> advisory;
        if (const auto overlay = overlays.find(doc->id); overlay != overlays.end()) advisory = overlay->second;
        next.state = DocumentState(next.markerLifecycle(), advisory);

        if (next != *doc) plan.updates.push_back({std::move(next), DocumentMarkers::of(*doc)});
    }

    return plan;
}

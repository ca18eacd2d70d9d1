#include "stats/Aggregator.hpp"
#include "log/Registry.hpp"

using namespace dm::stats;
using namespace dm::types;

Aggregator::Aggregator(std::shared_ptr<db::DocumentRepository> repo) : repo_(std::move(repo)) {}

FilestoreStats Aggregator::compute(const std::vector<db::DocumentPtr>& docs) {
    FilestoreStats stats;
    for (const auto& doc : docs) {
        stats.size_bytes += doc->size;

        if (doc->hasError() || doc->state.primary == Lifecycle::Failed) {
            ++stats.failed;
            continue;
        }

        switch (doc->state.primary) {
            case Lifecycle::Active: ++stats.active; break;
            case Lifecycle::Pending: ++stats.pending; break;
            case Lifecycle::Failed: break;
        }
    }
    return stats;
}

FilestoreStats Aggregator::recompute(const unsigned int filestoreId) const {
    const auto stats = compute(repo_->listDocuments(filestoreId));
    repo_->updateFilestoreStats(filestoreId, stats);
    log::Registry::stats()->debug("[Aggregator] Filestore {}: active={} pending={} failed={} size={}",
                                  filestoreId, stats.active, stats.pending, stats.failed, stats.size_bytes);
    return stats;
}

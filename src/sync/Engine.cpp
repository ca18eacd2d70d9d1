#include "sync/Engine.hpp"
#include "sync/Executor.hpp"
#include "sync/Planner.hpp"
#include "errors/errors.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <chrono>

using namespace dm::sync;
using namespace std::chrono;

Engine::Engine(std::shared_ptr<db::DocumentRepository> repo,
               std::shared_ptr<remote::Client> remote,
               std::shared_ptr<stats::Aggregator> aggregator,
               config::SyncConfig cfg)
    : repo_(std::move(repo)), remote_(std::move(remote)), aggregator_(std::move(aggregator)), cfg_(cfg) {}

model::Report Engine::sync(const unsigned int filestoreId) const {
    const auto start = steady_clock::now();

    const auto filestore = repo_->getFilestore(filestoreId);
    if (!filestore) throw errors::NotFound("Filestore " + std::to_string(filestoreId) + " does not exist");

    const auto locals = repo_->listDocuments(filestoreId);
    const auto remotes = remote_->listDocuments(filestore->name);

    log::Registry::sync()->info("[SyncEngine] Reconciling filestore {}: {} local, {} remote",
                                filestoreId, locals.size(), remotes.size());

    const auto plan = Planner::build(locals, remotes, cfg_, util::now());
    const auto written = Executor::apply(repo_, plan);
    aggregator_->recompute(filestoreId);

    const auto& r = plan.report;
    log::Registry::sync()->info(
        "[SyncEngine] Filestore {} reconciled in {} ms: matched={}, missing_local={}, missing_remote={}, "
        "missing_metadata={}, mismatch={}, duplicates={}, writes={}",
        filestoreId, duration_cast<milliseconds>(steady_clock::now() - start).count(),
        r.summary.matched_documents, r.missing_from_local.count, r.missing_from_remote.count,
        r.missing_metadata.count, r.metadata_mismatch.count, r.duplicate_documents.count, written);

    return r;
}

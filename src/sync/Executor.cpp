#include "sync/Executor.hpp"
#include "log/Registry.hpp"

using namespace dm::sync;

unsigned int Executor::apply(const std::shared_ptr<db::DocumentRepository>& repo, const model::Plan& plan) {
    if (plan.updates.empty()) return 0;

    for (const auto& [doc, expected] : plan.updates)
        log::Registry::sync()->debug("[Executor] Document {} -> {}", doc.id, types::to_string(doc.state));

    const auto written = repo->updateDocuments(plan.updates);
    if (written < plan.updates.size())
        log::Registry::sync()->info("[Executor] {} document(s) moved during reconciliation and were left for the next sync",
                                    plan.updates.size() - written);
    return written;
}

#include "services/UploadWorker.hpp"
#include "services/DocumentUploader.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/upload/UploadTask.hpp"
#include "errors/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace dm::services;
using namespace dm::concurrency;
using namespace dm::types;

namespace {

PollPolicy pollPolicyFrom(const dm::config::UploadConfig& cfg) {
    return PollPolicy{cfg.poll_interval, cfg.max_poll_attempts, cfg.poll_backoff, cfg.max_poll_interval};
}

}

UploadWorker::UploadWorker(std::shared_ptr<db::DocumentRepository> repo,
                           std::shared_ptr<remote::Client> remote,
                           std::shared_ptr<storage::ContentStore> store,
                           util::MimeResolver mime,
                           std::shared_ptr<stats::Aggregator> aggregator,
                           config::UploadConfig cfg)
    : AsyncService("UploadWorker"),
      repo_(std::move(repo)),
      remote_(std::move(remote)),
      aggregator_(std::move(aggregator)),
      cfg_(std::move(cfg)) {
    if (cfg_.batch_size == 0) throw std::invalid_argument("upload.batch_size must be at least 1");

    uploader_ = std::make_shared<DocumentUploader>(repo_, remote_, store, mime, pollPolicyFrom(cfg_), &interrupt_);
    // retries run on the caller's thread and must not observe the loop's stop signal
    retryUploader_ = std::make_shared<DocumentUploader>(repo_, remote_, std::move(store), std::move(mime),
                                                        pollPolicyFrom(cfg_), nullptr);
}

UploadWorker::~UploadWorker() {
    stop();
}

void UploadWorker::trigger() {
    pending_.store(true);
    if (!isRunning()) start();
    else interrupt_.poke();
}

BatchResult UploadWorker::runBatch() {
    std::scoped_lock lock(batchMutex_);

    BatchResult result;
    const auto claimed = repo_->claimPending(cfg_.batch_size);
    if (claimed.empty()) return result;

    log::Registry::worker()->info("[UploadWorker] Claimed {} document(s)", claimed.size());

    ThreadPool pool(static_cast<unsigned int>(claimed.size()));
    std::vector<std::pair<unsigned int, std::future<ExpectedFuture>>> futures;
    futures.reserve(claimed.size());

    for (const auto& doc : claimed) {
        result.claimed.push_back(doc->id);
        result.filestores.insert(doc->filestore_id);

        auto task = std::make_shared<UploadTask>(uploader_, doc);
        auto future = task->getFuture();
        pool.submit(task);
        futures.emplace_back(doc->id, std::move(*future));
    }

    unsigned int active = 0, failed = 0, lost = 0, interrupted = 0;
    for (auto& [id, future] : futures) {
        try {
            const auto outcome = future.get();
            if (const auto* terminal = std::get_if<std::shared_ptr<Document>>(&outcome)) {
                if ((*terminal)->hasError()) ++failed;
                else ++active;
            } else ++lost;
        } catch (const Interrupted&) {
            ++interrupted;
        } catch (const std::exception& e) {
            ++failed;
            log::Registry::worker()->error("[UploadWorker] Document {} could not be settled: {}", id, e.what());
        }
    }

    pool.stop();
    refreshStats(result.filestores);

    log::Registry::worker()->info("[UploadWorker] Batch finished: {} active, {} failed, {} lost, {} interrupted",
                                  active, failed, lost, interrupted);
    return result;
}

unsigned int UploadWorker::drain() {
    unsigned int processed = 0;
    while (!interrupted()) {
        const auto batch = runBatch();
        if (batch.empty()) break;
        processed += static_cast<unsigned int>(batch.claimed.size());
    }
    return processed;
}

dm::db::DocumentPtr UploadWorker::retry(const unsigned int documentId) {
    const auto doc = repo_->getDocument(documentId);
    if (!doc) throw errors::NotFound(fmt::format("Document {} does not exist", documentId));

    const auto previousName = doc->name;
    const auto claimed = repo_->retryClaim(documentId);
    if (!claimed) throw errors::Conflict(fmt::format("Document {} is already being uploaded", documentId));

    log::Registry::worker()->info("[UploadWorker] Retrying document {} ({})", claimed->id, claimed->display_name);

    if (previousName) {
        try {
            if (!remote_->deleteDocument(*previousName))
                log::Registry::worker()->debug("[UploadWorker] Stale remote copy {} was already gone", *previousName);
        } catch (const remote::Error& e) {
            log::Registry::worker()->warn("[UploadWorker] Could not delete stale remote copy {}: {}", *previousName, e.what());
        }
    }

    auto terminal = retryUploader_->process(*claimed);
    refreshStats({claimed->filestore_id});

    if (terminal) return terminal;

    auto current = repo_->getDocument(documentId);
    if (!current) throw errors::NotFound(fmt::format("Document {} was deleted during retry", documentId));
    return current;
}

unsigned int UploadWorker::recoverStale() {
    const auto released = repo_->releaseStaleClaims(cfg_.stale_claim_after);
    if (released > 0)
        log::Registry::worker()->warn("[UploadWorker] Released {} stale claim(s) older than {}s",
                                      released, cfg_.stale_claim_after.count());
    return released;
}

void UploadWorker::runLoop() {
    try {
        recoverStale();
    } catch (const std::exception& e) {
        log::Registry::worker()->error("[UploadWorker] Stale claim recovery failed: {}", e.what());
    }

    while (!interrupted()) {
        pending_.store(false);

        try {
            drain();
        } catch (const std::exception& e) {
            log::Registry::worker()->error("[UploadWorker] Batch failed: {}", e.what());
        }

        if (interrupted()) break;
        interrupt_.waitFor(cfg_.idle_rescan, [this] { return pending_.load(); });
    }
}

void UploadWorker::refreshStats(const std::set<unsigned int>& filestores) const {
    for (const auto id : filestores) {
        try {
            aggregator_->recompute(id);
        } catch (const std::exception& e) {
            log::Registry::stats()->error("[UploadWorker] Stats refresh for filestore {} failed: {}", id, e.what());
        }
    }
}

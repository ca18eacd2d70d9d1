#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "db/DocumentRepository.hpp"
#include "remote/Client.hpp"
#include "stats/Aggregator.hpp"
#include "storage/ContentStore.hpp"
#include "util/mime.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace dm::services {

class DocumentUploader;

struct BatchResult {
    std::vector<unsigned int> claimed;
    std::set<unsigned int> filestores;      // touched by the batch

    [[nodiscard]] bool empty() const { return claimed.empty(); }
};

// Background queue processor. Each batch claims up to upload.batch_size documents,
// uploads them concurrently and refreshes the counters of every touched filestore.
class UploadWorker final : public concurrency::AsyncService {
public:
    UploadWorker(std::shared_ptr<db::DocumentRepository> repo,
                 std::shared_ptr<remote::Client> remote,
                 std::shared_ptr<storage::ContentStore> store,
                 util::MimeResolver mime,
                 std::shared_ptr<stats::Aggregator> aggregator,
                 config::UploadConfig cfg);

    ~UploadWorker() override;

    // Wakes the loop, starting it when idle
    void trigger();

    BatchResult runBatch();

    // Runs batches until nothing claimable is left. Returns the number of documents processed.
    unsigned int drain();

    // Resets a terminal document and drives it through upload on the calling thread.
    // Throws errors::NotFound for an unknown id and errors::Conflict when it is in flight.
    db::DocumentPtr retry(unsigned int documentId);

    unsigned int recoverStale();

    [[nodiscard]] const config::UploadConfig& config() const { return cfg_; }

protected:
    void runLoop() override;

private:
    std::shared_ptr<db::DocumentRepository> repo_;
    std::shared_ptr<remote::Client> remote_;
    std::shared_ptr<stats::Aggregator> aggregator_;
    std::shared_ptr<DocumentUploader> uploader_, retryUploader_;
    config::UploadConfig cfg_;

    std::atomic<bool> pending_{false};
    std::mutex batchMutex_;

    void refreshStats(const std::set<unsigned int>& filestores) const;
};

}

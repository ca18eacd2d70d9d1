#pragma once

#include <gtest/gtest.h>

#include "FakeRemoteClient.hpp"
#include "MemoryRepository.hpp"
#include "config/Config.hpp"
#include "ingest/IngestionService.hpp"
#include "services/UploadWorker.hpp"
#include "stats/Aggregator.hpp"
#include "storage/ContentStore.hpp"

#include <atomic>
#include <filesystem>

namespace dm::test {

// Repository, remote, cache and services wired the way runtime::Deps wires them,
// with polling shortened for tests
class MirrorFixture : public ::testing::Test {
protected:
    std::filesystem::path cacheRoot;
    std::shared_ptr<MemoryRepository> repo;
    std::shared_ptr<FakeRemoteClient> remote;
    std::shared_ptr<storage::ContentStore> store;
    std::shared_ptr<stats::Aggregator> aggregator;
    util::MimeResolver mime;
    config::UploadConfig uploadCfg;
    std::atomic<unsigned int> wakes{0};

    db::FilestorePtr filestore;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        cacheRoot = std::filesystem::temp_directory_path()
                    / (std::string("docmirror_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(cacheRoot);

        repo = std::make_shared<MemoryRepository>();
        remote = std::make_shared<FakeRemoteClient>();
        store = std::make_shared<storage::ContentStore>(cacheRoot, mime);
        aggregator = std::make_shared<stats::Aggregator>(repo);

        uploadCfg.poll_interval = std::chrono::milliseconds(1);
        uploadCfg.max_poll_interval = std::chrono::milliseconds(1);
        uploadCfg.max_poll_attempts = 5;
        uploadCfg.idle_rescan = std::chrono::seconds(1);

        filestore = makeFilestore("Handbook");
    }

    void TearDown() override {
        std::filesystem::remove_all(cacheRoot);
    }

    db::FilestorePtr makeFilestore(const std::string& displayName) {
        const auto remoteStore = remote->createStore(displayName);
        types::Filestore f;
        f.name = remoteStore.name;
        f.display_name = displayName;
        return repo->createFilestore(f);
    }

    std::shared_ptr<ingest::IngestionService> ingestion() {
        return std::make_shared<ingest::IngestionService>(repo, remote, store, mime, [this] { ++wakes; });
    }

    std::shared_ptr<services::UploadWorker> worker() {
        return std::make_shared<services::UploadWorker>(repo, remote, store, mime, aggregator, uploadCfg);
    }

    db::DocumentPtr ingestFile(const std::string& filename, const std::string& content,
                           const std::optional<std::string>& category = std::nullopt,
                           const std::optional<unsigned int> filestoreId = std::nullopt) {
        return ingestion()->ingest(filestoreId.value_or(filestore->id), category,
                                   ingest::IncomingFile::fromBytes(filename, content));
    }
};

}

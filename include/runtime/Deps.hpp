#pragma once

#include <memory>

namespace dm::db { class DocumentRepository; }
namespace dm::remote { class Client; }
namespace dm::storage { class ContentStore; }
namespace dm::stats { class Aggregator; }
namespace dm::ingest { class IngestionService; }
namespace dm::services { class UploadWorker; class FilestoreService; }
namespace dm::sync { class Engine; }

namespace dm::runtime {

struct Deps {
    std::shared_ptr<db::DocumentRepository> repo;
    std::shared_ptr<remote::Client> remote;
    std::shared_ptr<storage::ContentStore> contentStore;
    std::shared_ptr<stats::Aggregator> aggregator;
    std::shared_ptr<services::UploadWorker> uploadWorker;
    std::shared_ptr<ingest::IngestionService> ingestion;
    std::shared_ptr<sync::Engine> syncEngine;
    std::shared_ptr<services::FilestoreService> filestores;

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;

    static Deps& get();

    // Builds every service from config::ConfigRegistry. Brings the schema up to date first.
    static void init();

    // Stops the worker and drops every service
    static void shutdown();

private:
    Deps() = default;  // private ctor
};

}

#include "runtime/Deps.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/PgRepository.hpp"
#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "ingest/IngestionService.hpp"
#include "log/Registry.hpp"
#include "remote/GeminiClient.hpp"
#include "services/FilestoreService.hpp"
#include "services/UploadWorker.hpp"
#include "stats/Aggregator.hpp"
#include "storage/ContentStore.hpp"
#include "sync/Engine.hpp"
#include "util/mime.hpp"

using namespace dm::runtime;

Deps& Deps::get() {
    static Deps instance_;
    return instance_;
}

void Deps::init() {
    if (get().repo) {
        log::Registry::docmirror()->warn("[Deps] Already initialized, ignoring second init()");
        return;
    }

    log::Registry::docmirror()->info("[Deps] Initializing...");

    const auto& cfg = config::ConfigRegistry::get();
    const auto connStr = cfg.database.connectionString();

    db::Schema::init(connStr);
    db::Transactions::init(connStr, cfg.database.pool_size);

    const util::MimeResolver mime(cfg.upload.mime_types, cfg.upload.omit_mime_extensions);

    auto& ctx = get();
    ctx.repo = std::make_shared<db::PgRepository>();
    ctx.remote = std::make_shared<remote::GeminiClient>(cfg.gemini, cfg.gemini.apiKey());
    ctx.contentStore = std::make_shared<storage::ContentStore>(cfg.cache.dir, mime);
    ctx.aggregator = std::make_shared<stats::Aggregator>(ctx.repo);
    ctx.uploadWorker = std::make_shared<services::UploadWorker>(ctx.repo, ctx.remote, ctx.contentStore, mime,
                                                                ctx.aggregator, cfg.upload);

    // one-shot commands drain the queue themselves; only a running loop is woken
    std::weak_ptr<services::UploadWorker> worker = ctx.uploadWorker;
    ctx.ingestion = std::make_shared<ingest::IngestionService>(ctx.repo, ctx.remote, ctx.contentStore, mime, [worker] {
        if (const auto w = worker.lock(); w && w->isRunning()) w->trigger();
    });

    ctx.syncEngine = std::make_shared<sync::Engine>(ctx.repo, ctx.remote, ctx.aggregator, cfg.sync);
    ctx.filestores = std::make_shared<services::FilestoreService>(ctx.repo, ctx.remote, ctx.aggregator);

    log::Registry::docmirror()->info("[Deps] Initialized.");
}

void Deps::shutdown() {
    auto& ctx = get();
    if (ctx.uploadWorker) ctx.uploadWorker->stop();

    ctx.filestores.reset();
    ctx.syncEngine.reset();
    ctx.ingestion.reset();
    ctx.uploadWorker.reset();
    ctx.aggregator.reset();
    ctx.contentStore.reset();
    ctx.remote.reset();
    ctx.repo.reset();
}

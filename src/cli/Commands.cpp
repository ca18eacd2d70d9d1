#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/DocumentRepository.hpp"
#include "ingest/IngestionService.hpp"
#include "log/Registry.hpp"
#include "runtime/Deps.hpp"
#include "services/FilestoreService.hpp"
#include "services/UploadWorker.hpp"
#include "sync/Engine.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <atomic>
#include <csignal>
#include <thread>

using namespace dm::cli;
using namespace dm::types;
using dm::runtime::Deps;

namespace {

std::atomic<bool> shouldExit{false};
std::atomic<bool> reopenLogs{false};

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

unsigned int requireId(const CommandCall& call, const size_t index, const std::string& what) {
    if (call.positionals.size() <= index) throw std::invalid_argument(fmt::format("Missing {}", what));
    const auto id = parseUInt(call.positionals[index]);
    if (!id) throw std::invalid_argument(fmt::format("Invalid {} '{}'", what, call.positionals[index]));
    return *id;
}

unsigned int optUInt(const CommandCall& call, const std::string& key, const unsigned int fallback) {
    const auto raw = optVal(call, key);
    if (!raw) return fallback;
    const auto value = parseUInt(*raw);
    if (!value) throw std::invalid_argument(fmt::format("--{} expects a number, got '{}'", key, *raw));
    return *value;
}

std::vector<std::string> csv(const std::string& raw) {
    std::vector<std::string> parts;
    boost::split(parts, raw, boost::is_any_of(","), boost::token_compress_on);
    for (auto& p : parts) boost::trim(p);
    std::erase_if(parts, [](const std::string& p) { return p.empty(); });
    return parts;
}

nlohmann::json documentsJson(const std::vector<dm::db::DocumentPtr>& docs) {
    nlohmann::json j;
    to_json(j, docs);
    return j;
}

CommandResult filestoresCmd(const CommandCall& call) {
    FilestoreQuery query;
    query.q = optVal(call, "q");
    query.user = optVal(call, "user");
    query.take = optUInt(call, "take", DEFAULT_TAKE);
    query.skip = optUInt(call, "skip", 0);

    nlohmann::json j;
    to_json(j, Deps::get().filestores->list(query));
    return okJson(j);
}

CommandResult createFilestoreCmd(const CommandCall& call) {
    if (call.positionals.empty()) throw std::invalid_argument("Missing display name");
    return okJson(*Deps::get().filestores->create(call.positionals.front(), optVal(call, "user")));
}

CommandResult deleteFilestoreCmd(const CommandCall& call) {
    const auto id = requireId(call, 0, "filestore id");
    Deps::get().filestores->remove(id);
    return okJson({{"deleted", id}});
}

CommandResult uploadCmd(const CommandCall& call) {
    const auto filestoreId = requireId(call, 0, "filestore id");
    if (call.positionals.size() < 2) throw std::invalid_argument("No files given");

    std::vector<dm::ingest::IncomingFile> files;
    for (size_t i = 1; i < call.positionals.size(); ++i)
        files.push_back(dm::ingest::IncomingFile::fromPath(call.positionals[i]));

    const auto& deps = Deps::get();
    auto docs = deps.ingestion->ingest(filestoreId, optVal(call, "category"), files);

    if (!hasFlag(call, "no-wait")) {
        deps.uploadWorker->drain();
        for (auto& doc : docs)
            if (auto current = deps.repo->getDocument(doc->id)) doc = std::move(current);
    }

    return okJson(documentsJson(docs));
}

CommandResult documentsCmd(const CommandCall& call) {
    DocumentQuery query;
    query.filestore_id = requireId(call, 0, "filestore id");
    query.category = optVal(call, "category");
    query.q = optVal(call, "q");
    query.hash = optVal(call, "hash");
    query.display_name = optVal(call, "display-name");
    if (const auto sort = optVal(call, "sort")) query.sort = *sort;
    if (const auto nulls = optVal(call, "null")) query.null_columns = csv(*nulls);
    if (const auto notNulls = optVal(call, "not-null")) query.not_null_columns = csv(*notNulls);
    query.take = optUInt(call, "take", DEFAULT_TAKE);
    query.skip = optUInt(call, "skip", 0);

    return okJson(documentsJson(Deps::get().filestores->documents(query)));
}

CommandResult deleteDocumentCmd(const CommandCall& call) {
    const auto id = requireId(call, 0, "document id");
    Deps::get().filestores->deleteDocument(id);
    return okJson({{"deleted", id}});
}

CommandResult remoteDocumentsCmd(const CommandCall& call) {
    const nlohmann::json j = Deps::get().filestores->remoteDocuments(requireId(call, 0, "filestore id"));
    return okJson(j);
}

CommandResult categoriesCmd(const CommandCall& call) {
    const nlohmann::json j = Deps::get().filestores->categories(requireId(call, 0, "filestore id"));
    return okJson(j);
}

CommandResult retryCmd(const CommandCall& call) {
    return okJson(*Deps::get().uploadWorker->retry(requireId(call, 0, "document id")));
}

CommandResult syncCmd(const CommandCall& call) {
    const nlohmann::json j = Deps::get().syncEngine->sync(requireId(call, 0, "filestore id"));
    return okJson(j);
}

CommandResult serveCmd(const CommandCall&) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    const auto& worker = Deps::get().uploadWorker;
    worker->start();
    dm::log::Registry::docmirror()->info("[*] docmirror serving, upload worker running");

    while (!shouldExit) {
        if (reopenLogs.exchange(false)) dm::log::Registry::reopenMainLog();
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    dm::log::Registry::docmirror()->info("[*] Shutting down upload worker...");
    worker->stop();
    return ok("");
}

CommandResult configCmd(const CommandCall&) {
    const nlohmann::json j = dm::config::ConfigRegistry::get();
    return okJson(j);
}

}

bool dm::cli::isOffline(const std::string& command) {
    return command == "config" || command == "help";
}

void dm::cli::registerCommands(Router& router) {
    router.registerSwitch("no-wait");

    router.registerCommand("filestores", "filestores [--q text] [--user u] [--take n] [--skip n]",
                           "List filestores with their counters", filestoresCmd);
    router.registerCommand("create-filestore", "create-filestore <displayName> [--user u]",
                           "Provision a remote store and record it", createFilestoreCmd);
    router.registerCommand("delete-filestore", "delete-filestore <id>",
                           "Delete a filestore, its remote store and its documents", deleteFilestoreCmd);
    router.registerCommand("upload", "upload <filestoreId> <file>... [--category c] [--no-wait]",
                           "Ingest files and upload them", uploadCmd);
    router.registerCommand("documents",
                           "documents <filestoreId> [--category c] [--q text] [--sort key] [--null a,b] [--not-null a,b]",
                           "Query local documents", documentsCmd);
    router.registerCommand("delete-document", "delete-document <id>",
                           "Delete a document locally and remotely", deleteDocumentCmd);
    router.registerCommand("remote-documents", "remote-documents <filestoreId>",
                           "List the documents held by the remote store", remoteDocumentsCmd);
    router.registerCommand("categories", "categories <filestoreId>",
                           "Document counts and sizes per category", categoriesCmd);
    router.registerCommand("retry", "retry <documentId>",
                           "Re-upload a document and wait for the outcome", retryCmd);
    router.registerCommand("sync", "sync <filestoreId>",
                           "Reconcile local documents against the remote store", syncCmd);
    router.registerCommand("serve", "serve",
                           "Run the upload worker until SIGINT or SIGTERM", serveCmd);
    router.registerCommand("config", "config",
                           "Print the effective configuration", configCmd);
    router.registerCommand("help", "help", "Show this help",
                           [&router](const CommandCall&) { return ok(router.help()); });
}

#include "concurrency/upload/UploadTask.hpp"
#include "services/DocumentUploader.hpp"
#include "types/Document.hpp"
#include "log/Registry.hpp"

using namespace dm::concurrency;

UploadTask::UploadTask(std::shared_ptr<services::DocumentUploader> up, std::shared_ptr<types::Document> d)
    : uploader(std::move(up)), doc(std::move(d)) {}

void UploadTask::operator()() {
    try {
        if (auto terminal = uploader->process(*doc)) promise.set_value(std::move(terminal));
        else promise.set_value(false);
    } catch (const std::exception& e) {
        log::Registry::worker()->debug("[UploadTask] Document {} did not finish: {}", doc->id, e.what());
        promise.set_exception(std::current_exception());
    }
}

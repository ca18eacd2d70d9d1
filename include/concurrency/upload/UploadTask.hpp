#pragma once

#include "concurrency/Task.hpp"

#include <memory>

namespace dm::services {
class DocumentUploader;
}

namespace dm::types {
struct Document;
}

namespace dm::concurrency {

// Resolves to the terminal document, or false when the claim was lost
struct UploadTask final : PromisedTask {
    std::shared_ptr<services::DocumentUploader> uploader;
    std::shared_ptr<types::Document> doc;

    UploadTask(std::shared_ptr<services::DocumentUploader> up, std::shared_ptr<types::Document> d);

    void operator()() override;
};

}

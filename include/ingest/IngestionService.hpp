#pragma once

#include "db/DocumentRepository.hpp"
#include "remote/Client.hpp"
#include "storage/ContentStore.hpp"
#include "util/mime.hpp"

#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dm::ingest {

struct IncomingFile {
    std::string filename;                  // original name, becomes the display name
    std::shared_ptr<std::istream> stream;

    static IncomingFile fromPath(const std::filesystem::path& path);
    static IncomingFile fromBytes(std::string filename, std::string bytes);
};

class IngestionService {
public:
    using WakeFn = std::function<void()>;

    IngestionService(std::shared_ptr<db::DocumentRepository> repo,
                     std::shared_ptr<remote::Client> remote,
                     std::shared_ptr<storage::ContentStore> store,
                     util::MimeResolver mime,
                     WakeFn wake = {});

    // Stores the bytes, replaces any document with the same hash in the
    // filestore and queues a new pending document. Throws errors::NotFound
    // for an unknown filestore.
    db::DocumentPtr ingest(unsigned int filestoreId,
                           const std::optional<std::string>& category,
                           const IncomingFile& upload);

    std::vector<db::DocumentPtr> ingest(unsigned int filestoreId,
                                        const std::optional<std::string>& category,
                                        const std::vector<IncomingFile>& uploads);

    void setWake(WakeFn wake) { wake_ = std::move(wake); }

private:
    std::shared_ptr<db::DocumentRepository> repo_;
    std::shared_ptr<remote::Client> remote_;
    std::shared_ptr<storage::ContentStore> store_;
    util::MimeResolver mime_;
    WakeFn wake_;

    db::FilestorePtr requireFilestore(unsigned int filestoreId) const;

    db::DocumentPtr ingestOne(const types::Filestore& filestore,
                              const std::optional<std::string>& category,
                              const IncomingFile& upload);

    void removeSuperseded(const types::Document& existing) const;

    void signal() const;
};

}

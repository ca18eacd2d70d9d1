#pragma once

#include "db/DocumentRepository.hpp"
#include "types/Filestore.hpp"

#include <memory>
#include <vector>

namespace dm::stats {

// Filestore counters, always recomputed wholesale from the document rows
class Aggregator {
public:
    explicit Aggregator(std::shared_ptr<db::DocumentRepository> repo);

    // Reads every document of the filestore and writes the four counters back
    types::FilestoreStats recompute(unsigned int filestoreId) const;

    // Failed wins over active; everything else (queued or in flight) is pending.
    // Advisory overlays count under their lifecycle.
    static types::FilestoreStats compute(const std::vector<db::DocumentPtr>& docs);

private:
    std::shared_ptr<db::DocumentRepository> repo_;
};

}

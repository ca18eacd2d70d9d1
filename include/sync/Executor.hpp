#pragma once

#include "db/DocumentRepository.hpp"
#include "sync/model/Report.hpp"

#include <memory>

namespace dm::sync {

class Executor {
public:
    // Writes every planned row in one transaction, skipping rows whose markers moved since
    // the snapshot. Returns the number of rows written.
    static unsigned int apply(const std::shared_ptr<db::DocumentRepository>& repo, const model::Plan& plan);
};

}

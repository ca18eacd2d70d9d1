#pragma once

#include "config/Config.hpp"
#include "db/DocumentRepository.hpp"
#include "remote/Client.hpp"
#include "stats/Aggregator.hpp"
#include "sync/model/Report.hpp"

#include <memory>

namespace dm::sync {

// Reconciles one filestore's local documents against its remote store
class Engine {
public:
    Engine(std::shared_ptr<db::DocumentRepository> repo,
           std::shared_ptr<remote::Client> remote,
           std::shared_ptr<stats::Aggregator> aggregator,
           config::SyncConfig cfg);

    // Throws errors::NotFound for an unknown filestore. Remote and storage faults propagate.
    model::Report sync(unsigned int filestoreId) const;

private:
    std::shared_ptr<db::DocumentRepository> repo_;
    std::shared_ptr<remote::Client> remote_;
    std::shared_ptr<stats::Aggregator> aggregator_;
    config::SyncConfig cfg_;
};

}

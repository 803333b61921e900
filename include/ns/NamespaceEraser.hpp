#pragma once

#include "db/KeyRepository.hpp"
#include "ns/Reaper.hpp"

#include <memory>

namespace km::ns {

class NamespaceEraser {
public:
    NamespaceEraser(std::shared_ptr<db::KeyRepository> repo, std::shared_ptr<Reaper> reaper);

    // Removes every key of (domain, nspace). On partial failure the repository keeps exactly the undestroyed entries.
    maintenance::Status clearNamespace(types::ClearableDomain domain, int64_t nspace);

private:
    std::shared_ptr<db::KeyRepository> repo_;
    std::shared_ptr<Reaper> reaper_;
};

}

#pragma once

#include "db/KeyRepository.hpp"
#include "maintenance/Result.hpp"

#include <memory>
#include <vector>

namespace km::sid {

class SidResolver {
public:
    explicit SidResolver(std::shared_ptr<db::KeyRepository> repo);

    // App uids of userId holding an auth-bound key that sid unlocks. Sorted, distinct.
    maintenance::Result<std::vector<int64_t>> getAppUidsAffectedBySid(int32_t userId, int64_t sid);

private:
    std::shared_ptr<db::KeyRepository> repo_;
};

}

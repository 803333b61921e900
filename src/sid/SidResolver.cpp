#include "sid/SidResolver.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace km::sid;
using namespace km::maintenance;

SidResolver::SidResolver(std::shared_ptr<db::KeyRepository> repo) : repo_(std::move(repo)) {}

Result<std::vector<int64_t>> SidResolver::getAppUidsAffectedBySid(const int32_t userId, const int64_t sid) {
    std::vector<int64_t> uids;
    if (userId < 0) return uids;  // owns no app uids

    try {
        uids = repo_->namespacesBoundToSid(userId, sid);
    } catch (const std::exception& e) {
        log::Registry::sid()->error("[SidResolver] Lookup for user {} failed: {}", userId, e.what());
        return Error::systemError(fmt::format("Failed to look up keys of user {}", userId));
    }

    std::ranges::sort(uids);
    uids.erase(std::unique(uids.begin(), uids.end()), uids.end());

    log::Registry::sid()->debug("[SidResolver] user {}: {} app uid(s) affected", userId, uids.size());
    return uids;
}

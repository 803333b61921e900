#include "ns/NamespaceEraser.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace km::ns;
using namespace km::maintenance;
using namespace km::types;

NamespaceEraser::NamespaceEraser(std::shared_ptr<db::KeyRepository> repo, std::shared_ptr<Reaper> reaper)
    : repo_(std::move(repo)), reaper_(std::move(reaper)) {}

Status NamespaceEraser::clearNamespace(const ClearableDomain domain, const int64_t nspace) {
    const auto label = fmt::format("{}:{}", to_string(domain.get()), nspace);

    std::vector<KeyEntry> entries;
    try {
        entries = repo_->listNamespace(domain, nspace);
    } catch (const std::exception& e) {
        log::Registry::nspace()->error("[NamespaceEraser] Listing {} failed: {}", label, e.what());
        return Error::systemError("Failed to list namespace " + label);
    }

    if (entries.empty()) {
        log::Registry::nspace()->debug("[NamespaceEraser] {} is already empty", label);
        return ok();
    }

    const auto report = reaper_->destroyKeys(entries);

    if (!report.destroyed.empty()) {
        db::ChangeSet changes;
        changes.deleteEntries = report.destroyed;
        try {
            repo_->commit(changes);
        } catch (const std::exception& e) {
            log::Registry::nspace()->error("[NamespaceEraser] Commit for {} failed: {}", label, e.what());
            return Error::systemError("Failed to record key deletion in " + label);
        }
    }

    if (!report.complete()) {
        log::Registry::nspace()->error("[NamespaceEraser] {}: {} of {} keys could not be destroyed",
                                       label, report.failed.size(), entries.size());
        return Error::systemError(fmt::format("{} key(s) in {} could not be destroyed: {}",
                                              report.failed.size(), label, report.firstError->message));
    }

    log::Registry::nspace()->info("[NamespaceEraser] Cleared {} ({} keys)", label, entries.size());
    return ok();
}

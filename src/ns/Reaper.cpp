#include "ns/Reaper.hpp"
#include "log/Registry.hpp"

using namespace km::ns;
using namespace km::maintenance;
using namespace km::types;

Reaper::Reaper(backend::BackendSet backends) : backends_(std::move(backends)) {}

Status Reaper::destroyBlob(const SecurityLevel level, const std::vector<uint8_t>& blob) const {
    const auto device = backends_.get(level);
    if (!device) return Error::systemError("No backend at security level " + to_string(level));

    auto res = device->destroyKey(blob);
    if (!res && backend::isAlreadyDestroyed(res.error())) return ok();
    return res;
}

ReapReport Reaper::destroyKeys(const std::vector<KeyEntry>& entries) const {
    ReapReport report;
    for (const auto& e : entries) {
        const auto res = destroyBlob(e.security_level, e.blob);
        if (res) {
            report.destroyed.push_back(e.id);
            continue;
        }

        log::Registry::nspace()->warn("[Reaper] Failed to destroy {}: {}", to_string(e), to_string(res.error()));
        report.failed.push_back(e.id);
        if (!report.firstError) report.firstError = res.error();
    }
    return report;
}

#pragma once

#include "backend/BackendSet.hpp"
#include "maintenance/Result.hpp"
#include "types/KeyEntry.hpp"

#include <optional>
#include <vector>

namespace km::ns {

struct ReapReport {
    std::vector<int64_t> destroyed;  // entry ids whose key material is confirmed gone
    std::vector<int64_t> failed;
    std::optional<maintenance::Error> firstError;

    [[nodiscard]] bool complete() const { return failed.empty(); }
};

// Destroys key material on the owning backend. Every entry is attempted; nothing is written to the repository.
class Reaper {
public:
    explicit Reaper(backend::BackendSet backends);

    [[nodiscard]] ReapReport destroyKeys(const std::vector<types::KeyEntry>& entries) const;

    // An INVALID_KEY_BLOB answer counts as success.
    [[nodiscard]] maintenance::Status destroyBlob(types::SecurityLevel level, const std::vector<uint8_t>& blob) const;

    [[nodiscard]] const backend::BackendSet& backends() const { return backends_; }

private:
    backend::BackendSet backends_;
};

}

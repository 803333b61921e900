#pragma once

#include "fakes/FakeBackend.hpp"
#include "fakes/MemoryKeyRepository.hpp"
#include "fakes/StaticOracle.hpp"

#include "maintenance/Maintenance.hpp"

#include <memory>
#include <string>

namespace km::test {

constexpr uint32_t SYSTEM_UID = 1000;

// Full authority over in-memory state with a TEE and a StrongBox fake.
struct Harness {
    std::shared_ptr<MemoryKeyRepository> repo = std::make_shared<MemoryKeyRepository>();
    std::shared_ptr<FakeBackend> tee = std::make_shared<FakeBackend>(types::SecurityLevel::TrustedEnvironment);
    std::shared_ptr<FakeBackend> strongbox = std::make_shared<FakeBackend>(types::SecurityLevel::StrongBox);
    std::shared_ptr<StaticOracle> oracle = std::make_shared<StaticOracle>();

    std::shared_ptr<ns::Reaper> reaper;
    std::shared_ptr<user::SuperKeyManager> users;
    std::shared_ptr<ns::NamespaceEraser> eraser;
    std::shared_ptr<migrate::KeyMigrator> migrator;
    std::shared_ptr<sid::SidResolver> sids;
    std::shared_ptr<maintenance::Maintenance> authority;

    types::CallerContext system{SYSTEM_UID, 1, "u:r:system_server:s0"};

    Harness() {
        backend::BackendSet backends;
        backends.add(tee);
        backends.add(strongbox);
        reaper = std::make_shared<ns::Reaper>(std::move(backends));

        users = std::make_shared<user::SuperKeyManager>(repo, reaper, fastKdf(), types::SecurityLevel::TrustedEnvironment);
        eraser = std::make_shared<ns::NamespaceEraser>(repo, reaper);
        migrator = std::make_shared<migrate::KeyMigrator>(repo, oracle);
        sids = std::make_shared<sid::SidResolver>(repo);
        authority = std::make_shared<maintenance::Maintenance>(repo, oracle, oracle, users, eraser, migrator, sids);

        oracle->grantAllKeystore(SYSTEM_UID);
        oracle->grantManageUsers(SYSTEM_UID);
    }

    static config::SuperKeysConfig fastKdf() {
        config::SuperKeysConfig cfg;
        cfg.kdf_ops_limit = 1;
        cfg.kdf_mem_limit = 8192;
        return cfg;
    }

    // Creates real key material on the fake device and records it.
    types::KeyEntry addKey(const types::Domain domain, const int64_t nspace, const std::string& alias,
                           const types::SecurityLevel level = types::SecurityLevel::TrustedEnvironment,
                           const bool authBound = false, std::vector<int64_t> authSids = {}) {
        auto device = level == types::SecurityLevel::StrongBox ? strongbox : tee;

        types::KeyEntry e;
        e.domain = domain;
        e.nspace = nspace;
        e.alias = alias;
        e.security_level = level;
        e.blob = device->createKey({.auth_bound = authBound, .auth_sids = authSids}).value();
        e.authorizations.auth_bound = authBound;
        e.authorizations.auth_sids = std::move(authSids);
        e.id = repo->insertKeyEntry(e);
        return e;
    }

    static std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }
};

}

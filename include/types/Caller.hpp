#pragma once

#include <cstdint>
#include <string>

namespace km::types {

struct CallerContext {
    uint32_t uid{};
    int32_t pid{};
    std::string selinux_context;
};

}

#include "security/ProcessCaller.hpp"

#include <fstream>
#include <string>
#include <unistd.h>

using namespace km::types;

CallerContext km::security::processCaller() {
    CallerContext caller;
    caller.uid = static_cast<uint32_t>(::getuid());
    caller.pid = static_cast<int32_t>(::getpid());

    // Absent without SELinux; the label is then empty.
    if (std::ifstream attr("/proc/self/attr/current"); attr) {
        std::getline(attr, caller.selinux_context, '\0');
        while (!caller.selinux_context.empty() &&
               (caller.selinux_context.back() == '\n' || caller.selinux_context.back() == '\0'))
            caller.selinux_context.pop_back();
    }
    return caller;
}

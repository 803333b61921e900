#pragma once

#include "types/Caller.hpp"

namespace km::security {

// The caller as the kernel reports it for this process: real uid, pid and SELinux label.
types::CallerContext processCaller();

}

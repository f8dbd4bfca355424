#pragma once

#include <string>
#include <stddef.h>
#include "MTPLog.h"

struct MTPConfig {
    std::string backend = "auto";   // auto, libmtp, gvfs, wpd
    std::string gvfsRoot;           // empty means /run/user/<uid>/gvfs
    std::string logPath = DebugLogDefaultPath();
    size_t pageSize = 16;
    size_t blockSize = 64 * 1024;
    int libmtpDebug = 0;

    std::string ResolvedGvfsRoot() const;

    // Applies MTP_ACCESS_* environment overrides on top of the defaults
    static MTPConfig FromEnvironment();
};

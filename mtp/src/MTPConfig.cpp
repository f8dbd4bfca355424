#include "MTPConfig.h"
#include "MTPLog.h"
#include <stdlib.h>
#include <errno.h>
#ifndef _WIN32
#include <unistd.h>
#endif

static bool ReadSizeVar(const char *name, size_t &value)
{
    const char *text = getenv(name);
    if (!text || !*text) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    unsigned long long parsed = strtoull(text, &end, 10);
    if (errno != 0 || !end || *end != '\0' || parsed == 0) {
        DBG("Ignoring invalid %s='%s'", name, text);
        return false;
    }
    value = static_cast<size_t>(parsed);
    return true;
}

std::string MTPConfig::ResolvedGvfsRoot() const
{
    if (!gvfsRoot.empty()) {
        return gvfsRoot;
    }
#ifdef _WIN32
    return std::string();
#else
    return "/run/user/" + std::to_string(getuid()) + "/gvfs";
#endif
}

MTPConfig MTPConfig::FromEnvironment()
{
    MTPConfig config;

    if (const char *backend = getenv("MTP_ACCESS_BACKEND")) {
        if (*backend) {
            config.backend = backend;
        }
    }
    if (const char *root = getenv("MTP_ACCESS_GVFS_ROOT")) {
        config.gvfsRoot = root;
    }
    // Set but empty disables logging
    if (const char *log = getenv("MTP_ACCESS_LOG")) {
        config.logPath = log;
    }
    ReadSizeVar("MTP_ACCESS_PAGE_SIZE", config.pageSize);
    ReadSizeVar("MTP_ACCESS_BLOCK_SIZE", config.blockSize);
    if (const char *debug = getenv("MTP_ACCESS_LIBMTP_DEBUG")) {
        config.libmtpDebug = atoi(debug);
    }
    return config;
}

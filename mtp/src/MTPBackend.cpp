#include "MTPBackend.h"
#include "MTPConfig.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#ifdef _WIN32
#include "MTPWpdBackend.h"
#else
#include "MTPGvfsBackend.h"
#include "MTPLibmtpBackend.h"
#endif

std::shared_ptr<MTPBackend> MTPCreateBackend(const MTPConfig &config)
{
    std::string name = config.backend.empty() ? "auto" : config.backend;

#ifdef _WIN32
    if (name == "auto" || name == "wpd") {
        DBG("Using WPD backend");
        return std::make_shared<MTPWpdBackend>(config);
    }
#else
    if (name == "auto") {
        name = MTPGvfsBackend::HasMtpMounts(config.ResolvedGvfsRoot()) ? "gvfs" : "libmtp";
        DBG("Auto-selected backend: %s", name.c_str());
    }
    if (name == "gvfs") {
        return std::make_shared<MTPGvfsBackend>(config);
    }
    if (name == "libmtp") {
        return std::make_shared<MTPLibmtpBackend>(config);
    }
#endif

    DBG("Backend '%s' is not available on this platform", name.c_str());
    throw MTPDeviceAccessError("backend '" + name + "' is not available", ENOTSUP);
}

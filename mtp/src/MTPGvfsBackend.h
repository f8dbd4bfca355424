#pragma once

#include <string>
#include <vector>
#include <memory>
#include "MTPBackend.h"
#include "MTPConfig.h"

// Devices exposed by the desktop as a user-space mount, e.g.
// /run/user/1000/gvfs/mtp:host=SAMSUNG_Galaxy_R58M12.
// Object ids are absolute native paths.
class MTPGvfsBackend : public MTPBackend {
private:
    MTPConfig _config;
    std::string _root;

public:
    explicit MTPGvfsBackend(const MTPConfig &config);

    const char *Name() const override { return "gvfs"; }

    // Only the first mount that has content is reported
    std::vector<std::string> EnumerateDevices() override;
    std::unique_ptr<MTPConnection> OpenDevice(const std::string &deviceId) override;
    std::string DeviceDescription(const std::string &deviceId) override;
    std::string DeviceFriendlyName(const std::string &deviceId) override;

    static bool HasMtpMounts(const std::string &root);

    struct MountName {
        std::string name;
        std::string description;
        std::string serialNumber;
    };
    static MountName ParseMountName(const std::string &mountPath);
};

#pragma once

#include <string>
#include <vector>
#include <memory>
#include "MTPBackend.h"
#include "MTPConfig.h"

class MTPDevice;

// Owns the backend session to the platform device subsystem
class MTPDeviceManager {
private:
    std::shared_ptr<MTPBackend> _backend;

public:
    explicit MTPDeviceManager(std::shared_ptr<MTPBackend> backend);
    explicit MTPDeviceManager(const MTPConfig &config);

    const std::shared_ptr<MTPBackend> &GetBackend() const { return _backend; }

    // Throws MTPDeviceAccessError when the device registry cannot be reached
    std::vector<std::shared_ptr<MTPDevice>> ListDevices();

    // Process-wide instance configured from the environment, created once
    static MTPDeviceManager &Default();
};

#include "MTPDeviceManager.h"
#include "MTPDevice.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include <mutex>

MTPDeviceManager::MTPDeviceManager(std::shared_ptr<MTPBackend> backend)
    : _backend(std::move(backend))
{
    if (!_backend) {
        throw MTPDeviceAccessError("no device backend", EINVAL);
    }
}

MTPDeviceManager::MTPDeviceManager(const MTPConfig &config)
{
    DebugLogSetPath(config.logPath.c_str());
    try {
        _backend = MTPCreateBackend(config);
    } catch (const MTPTransportError &e) {
        throw MTPDeviceAccessError(std::string("cannot reach the device registry: ") + e.what(), e.Code());
    }
    DBG("Device manager using %s backend", _backend->Name());
}

std::vector<std::shared_ptr<MTPDevice>> MTPDeviceManager::ListDevices()
{
    std::vector<std::string> ids;
    try {
        ids = _backend->EnumerateDevices();
    } catch (const MTPTransportError &e) {
        DBG("Device enumeration failed: %s", e.what());
        throw MTPDeviceAccessError(std::string("error getting list of devices: ") + e.what(), e.Code());
    }

    std::vector<std::shared_ptr<MTPDevice>> devices;
    for (const auto &id : ids) {
        devices.push_back(std::make_shared<MTPDevice>(_backend, id));
    }
    DBG("Found %zu device(s)", devices.size());
    return devices;
}

MTPDeviceManager &MTPDeviceManager::Default()
{
    static std::once_flag created;
    static std::unique_ptr<MTPDeviceManager> instance;
    std::call_once(created, []() {
        instance = std::make_unique<MTPDeviceManager>(MTPConfig::FromEnvironment());
    });
    return *instance;
}

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "MTPTypes.h"
#include "MTPBackend.h"
#include "MTPContent.h"

// One attached portable device. The native session is opened on first
// content access and kept for the lifetime of the object.
class MTPDevice {
private:
    std::shared_ptr<MTPBackend> _backend;
    std::string _deviceId;
    std::shared_ptr<MTPConnection> _connection;
    std::optional<MTPDeviceDescription> _description;

    std::shared_ptr<MTPConnection> Connection();

public:
    MTPDevice(std::shared_ptr<MTPBackend> backend, const std::string &deviceId);
    virtual ~MTPDevice();

    const std::string &GetDeviceId() const { return _deviceId; }
    bool IsConnected() const { return _connection != nullptr; }

    // Never throws; falls back as far as an empty string
    MTPDeviceDescription GetDescription();
    std::string GetName() { return GetDescription().name; }

    std::string GetSerialNumber();
    std::string GetDevicePath();

    // Root node whose full path is the device name
    MTPContentPtr GetRootContent();

    // The device root for backends that have one, otherwise the storages sorted by name
    std::vector<MTPContentPtr> GetContent();
};

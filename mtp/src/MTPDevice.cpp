#include "MTPDevice.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include <algorithm>

MTPDevice::MTPDevice(std::shared_ptr<MTPBackend> backend, const std::string &deviceId)
    : _backend(std::move(backend))
    , _deviceId(deviceId)
{
    DBG("MTPDevice created for device: %s", deviceId.c_str());
}

MTPDevice::~MTPDevice()
{
    DBG("MTPDevice destroyed for device: %s", _deviceId.c_str());
}

std::shared_ptr<MTPConnection> MTPDevice::Connection()
{
    if (!_connection) {
        DBG("Opening device %s via %s", _deviceId.c_str(), _backend->Name());
        try {
            _connection = _backend->OpenDevice(_deviceId);
        } catch (const MTPTransportError &e) {
            DBG("Cannot open device %s: %s", _deviceId.c_str(), e.what());
            throw MTPDeviceAccessError("open device '" + _deviceId + "': " + e.what(), e.Code());
        }
    }
    return _connection;
}

MTPDeviceDescription MTPDevice::GetDescription()
{
    if (_description) {
        return *_description;
    }

    MTPDeviceDescription result;
    try {
        result.description = _backend->DeviceDescription(_deviceId);
    } catch (const MTPError &e) {
        DBG("No description for %s: %s", _deviceId.c_str(), e.what());
    }

    try {
        result.name = _backend->DeviceFriendlyName(_deviceId);
    } catch (const MTPError &e) {
        DBG("No friendly name for %s: %s", _deviceId.c_str(), e.what());
        result.name = result.description;
        try {
            auto connection = Connection();
            MTPProperties props = connection->GetProperties(connection->RootObjectId());
            if (!props.name.empty()) {
                result.name = props.name;
            }
        } catch (const MTPError &inner) {
            DBG("Device object of %s has no name: %s", _deviceId.c_str(), inner.what());
        }
    }

    if (result.description.empty()) {
        result.description = result.name;
    }
    DBG("Device %s: name='%s' description='%s'", _deviceId.c_str(), result.name.c_str(),
        result.description.c_str());
    _description = result;
    return result;
}

std::string MTPDevice::GetSerialNumber()
{
    try {
        return GetRootContent()->GetProperties().serialNumber;
    } catch (const MTPContentIOError &e) {
        throw MTPDeviceAccessError("get serial number of '" + _deviceId + "': " + e.what(), e.Code());
    }
}

std::string MTPDevice::GetDevicePath()
{
    auto connection = Connection();
    return connection->NativePath(connection->RootObjectId());
}

MTPContentPtr MTPDevice::GetRootContent()
{
    std::string name = GetName();
    auto connection = Connection();
    return MTPContent::CreateRoot(connection, connection->RootObjectId(), name);
}

std::vector<MTPContentPtr> MTPDevice::GetContent()
{
    MTPContentPtr root = GetRootContent();
    if (_connection->HasDeviceRoot()) {
        return {root};
    }

    std::vector<MTPContentPtr> storages;
    try {
        storages = root->ListChildren();
        std::sort(storages.begin(), storages.end(),
            [](const MTPContentPtr &a, const MTPContentPtr &b) { return a->GetName() < b->GetName(); });
    } catch (const MTPContentIOError &e) {
        throw MTPDeviceAccessError("list storages of '" + _deviceId + "': " + e.what(), e.Code());
    }
    return storages;
}

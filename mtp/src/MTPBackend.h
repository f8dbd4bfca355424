#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdint.h>
#include "MTPTypes.h"

class MTPByteSource;
class MTPByteSink;
struct MTPConfig;

// Resumable child enumeration. An empty page means the enumeration is exhausted.
class MTPObjectCursor {
public:
    virtual ~MTPObjectCursor() = default;
    virtual std::vector<std::string> NextPage() = 0;
};

// An open session to one device. All ids are opaque backend object identifiers.
// Every method reports failures with MTPTransportError.
class MTPConnection {
public:
    virtual ~MTPConnection() = default;

    virtual std::string RootObjectId() const = 0;

    // True when the root is a synthetic device object above the storages
    virtual bool HasDeviceRoot() const = 0;

    // Backend-native location of an object (mount path or encoded id)
    virtual std::string NativePath(const std::string &objectId) const = 0;

    virtual std::unique_ptr<MTPObjectCursor> EnumObjects(const std::string &parentId) = 0;

    // One round-trip fetching every recognized property
    virtual MTPProperties GetProperties(const std::string &objectId) = 0;

    // Returns the id of the new folder
    virtual std::string CreateFolder(const std::string &parentId, const std::string &name) = 0;

    virtual void PutObject(const std::string &parentId, const std::string &name,
                           uint64_t length, MTPByteSource &source) = 0;
    virtual void GetObject(const std::string &objectId, MTPByteSink &sink) = 0;

    virtual void DeleteObject(const std::string &objectId, MTPDeleteMode mode) = 0;
};

class MTPBackend {
public:
    virtual ~MTPBackend() = default;

    virtual const char *Name() const = 0;

    virtual std::vector<std::string> EnumerateDevices() = 0;
    virtual std::unique_ptr<MTPConnection> OpenDevice(const std::string &deviceId) = 0;

    virtual std::string DeviceDescription(const std::string &deviceId) = 0;
    virtual std::string DeviceFriendlyName(const std::string &deviceId) = 0;
};

// Picks the backend named by config.backend, "auto" detects the platform's one.
// Throws MTPDeviceAccessError for unknown or unavailable backends.
std::shared_ptr<MTPBackend> MTPCreateBackend(const MTPConfig &config);

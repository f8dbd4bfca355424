#pragma once

#include <string>
#include <vector>
#include <memory>
#include <libmtp.h>
#include "MTPBackend.h"
#include "MTPConfig.h"

// Devices reached directly over USB through libmtp.
// Object ids: "DEVICE" for the device root, "S<storage>" for storages and
// "O<storage><handle>" for files and folders, all as 8-digit hex.
class MTPLibmtpBackend : public MTPBackend {
private:
    MTPConfig _config;

    static void InitializeMTP(int debugLevel);

public:
    explicit MTPLibmtpBackend(const MTPConfig &config);

    const char *Name() const override { return "libmtp"; }

    std::vector<std::string> EnumerateDevices() override;
    std::unique_ptr<MTPConnection> OpenDevice(const std::string &deviceId) override;
    std::string DeviceDescription(const std::string &deviceId) override;

    // Needs an open session, so it is never answered here
    std::string DeviceFriendlyName(const std::string &deviceId) override;

    static std::string EncodeDeviceId(const LIBMTP_raw_device_t &raw);
    static std::string EncodeStorageId(uint32_t storageId);
    static std::string EncodeObjectId(uint32_t storageId, uint32_t handle);
    static bool DecodeStorageId(const std::string &encodedId, uint32_t &storageId);
    static bool DecodeObjectId(const std::string &encodedId, uint32_t &storageId, uint32_t &handle);

    static std::string GetStorageDisplayName(const LIBMTP_devicestorage_t *storage);
};

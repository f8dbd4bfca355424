#pragma once

#include <string>
#include <vector>
#include <memory>
#include <windows.h>
#include <wrl/client.h>
#include <PortableDeviceApi.h>
#include <PortableDevice.h>
#include "MTPBackend.h"
#include "MTPConfig.h"

// Windows Portable Devices. Object ids are the WPD object id strings in UTF-8.
class MTPWpdBackend : public MTPBackend {
private:
    MTPConfig _config;
    Microsoft::WRL::ComPtr<IPortableDeviceManager> _manager;

public:
    explicit MTPWpdBackend(const MTPConfig &config);

    const char *Name() const override { return "wpd"; }

    std::vector<std::string> EnumerateDevices() override;
    std::unique_ptr<MTPConnection> OpenDevice(const std::string &deviceId) override;
    std::string DeviceDescription(const std::string &deviceId) override;
    std::string DeviceFriendlyName(const std::string &deviceId) override;

    static std::string ToUtf8(const wchar_t *text);
    static std::wstring ToWide(const std::string &text);
    static int HResultToErrno(HRESULT hr);
};

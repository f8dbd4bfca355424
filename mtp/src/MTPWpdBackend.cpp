#include "MTPWpdBackend.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPTransfer.h"
#include <mutex>
#include <errno.h>
#include <stdio.h>

using Microsoft::WRL::ComPtr;

namespace {

const wchar_t *kDeviceObjectId = L"DEVICE";
const DWORD kEnumPageSize = 16;

[[noreturn]] void ThrowHr(const std::string &what, HRESULT hr)
{
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "0x%08lx", static_cast<unsigned long>(hr));
    DBG("%s failed: HRESULT %s", what.c_str(), buffer);
    throw MTPTransportError(what + ": HRESULT " + buffer, MTPWpdBackend::HResultToErrno(hr));
}

// Freed with CoTaskMemFree, as WPD hands out every string
struct CoTaskString {
    LPWSTR text = nullptr;
    ~CoTaskString() { CoTaskMemFree(text); }
};

struct PropVariant {
    PROPVARIANT value;
    PropVariant() { PropVariantInit(&value); }
    ~PropVariant() { PropVariantClear(&value); }
};

void InitializeCom()
{
    static std::once_flag initialized;
    std::call_once(initialized, []() {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        if (FAILED(hr) && hr != RPC_E_CHANGED_MODE) {
            DBG("CoInitializeEx failed: 0x%08lx", static_cast<unsigned long>(hr));
        }
    });
}

// One key collection shared by every property fetch, read-only after creation
IPortableDeviceKeyCollection *PropertyKeys()
{
    static std::once_flag created;
    static ComPtr<IPortableDeviceKeyCollection> keys;
    static HRESULT createResult = S_OK;
    std::call_once(created, []() {
        createResult = CoCreateInstance(CLSID_PortableDeviceKeyCollection, nullptr, CLSCTX_INPROC_SERVER,
                                        IID_PPV_ARGS(&keys));
        if (FAILED(createResult)) {
            return;
        }
        const PROPERTYKEY wanted[] = {
            WPD_OBJECT_NAME, WPD_OBJECT_ORIGINAL_FILE_NAME, WPD_OBJECT_CONTENT_TYPE,
            WPD_OBJECT_SIZE, WPD_OBJECT_DATE_MODIFIED, WPD_STORAGE_CAPACITY,
            WPD_STORAGE_FREE_SPACE_IN_BYTES, WPD_DEVICE_SERIAL_NUMBER,
        };
        for (const auto &key : wanted) {
            keys->Add(key);
        }
    });
    if (FAILED(createResult)) {
        ThrowHr("create property key collection", createResult);
    }
    return keys.Get();
}

ComPtr<IPortableDeviceValues> ClientInformation()
{
    ComPtr<IPortableDeviceValues> info;
    HRESULT hr = CoCreateInstance(CLSID_PortableDeviceValues, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&info));
    if (FAILED(hr)) {
        ThrowHr("create client information", hr);
    }
    info->SetStringValue(WPD_CLIENT_NAME, L"mtpaccess");
    info->SetUnsignedIntegerValue(WPD_CLIENT_MAJOR_VERSION, 1);
    info->SetUnsignedIntegerValue(WPD_CLIENT_MINOR_VERSION, 0);
    info->SetUnsignedIntegerValue(WPD_CLIENT_REVISION, 0);
    info->SetUnsignedIntegerValue(WPD_CLIENT_SECURITY_QUALITY_OF_SERVICE, SECURITY_IMPERSONATION);
    info->SetUnsignedIntegerValue(WPD_CLIENT_DESIRED_ACCESS, GENERIC_READ | GENERIC_WRITE);
    return info;
}

time_t VariantDateToTime(DATE date)
{
    // OLE automation dates count days from 1899-12-30
    return static_cast<time_t>((date - 25569.0) * 86400.0);
}

class WpdCursor : public MTPObjectCursor {
private:
    ComPtr<IEnumPortableDeviceObjectIDs> _enum;
    std::string _parentId;

public:
    WpdCursor(ComPtr<IEnumPortableDeviceObjectIDs> objects, const std::string &parentId)
        : _enum(std::move(objects))
        , _parentId(parentId)
    {
    }

    std::vector<std::string> NextPage() override
    {
        std::vector<std::string> page;
        if (!_enum) {
            return page;
        }
        LPWSTR ids[kEnumPageSize] = {};
        DWORD fetched = 0;
        HRESULT hr = _enum->Next(kEnumPageSize, ids, &fetched);
        for (DWORD i = 0; i < fetched; i++) {
            page.push_back(MTPWpdBackend::ToUtf8(ids[i]));
            CoTaskMemFree(ids[i]);
        }
        if (FAILED(hr)) {
            _enum.Reset();
            ThrowHr("enumerate children of '" + _parentId + "'", hr);
        }
        if (fetched == 0) {
            _enum.Reset();
        }
        return page;
    }
};

class WpdConnection : public MTPConnection {
private:
    std::string _deviceId;
    ComPtr<IPortableDevice> _device;
    ComPtr<IPortableDeviceContent> _content;
    ComPtr<IPortableDeviceProperties> _properties;

    ComPtr<IPortableDeviceValues> NewObjectValues(const std::string &parentId, const std::string &name,
                                                  const GUID &contentType, uint64_t size)
    {
        ComPtr<IPortableDeviceValues> values;
        HRESULT hr = CoCreateInstance(CLSID_PortableDeviceValues, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&values));
        if (FAILED(hr)) {
            ThrowHr("create object values", hr);
        }
        std::wstring wparent = MTPWpdBackend::ToWide(parentId);
        std::wstring wname = MTPWpdBackend::ToWide(name);
        values->SetStringValue(WPD_OBJECT_PARENT_ID, wparent.c_str());
        values->SetStringValue(WPD_OBJECT_NAME, wname.c_str());
        values->SetStringValue(WPD_OBJECT_ORIGINAL_FILE_NAME, wname.c_str());
        values->SetGuidValue(WPD_OBJECT_CONTENT_TYPE, contentType);
        if (IsEqualGUID(contentType, WPD_CONTENT_TYPE_FOLDER)) {
            values->SetGuidValue(WPD_OBJECT_FORMAT, WPD_OBJECT_FORMAT_PROPERTIES_ONLY);
        } else {
            values->SetGuidValue(WPD_OBJECT_FORMAT, WPD_OBJECT_FORMAT_UNSPECIFIED);
            values->SetUnsignedLargeIntegerValue(WPD_OBJECT_SIZE, size);
        }
        return values;
    }

public:
    WpdConnection(const std::string &deviceId, ComPtr<IPortableDevice> device)
        : _deviceId(deviceId)
        , _device(std::move(device))
    {
        HRESULT hr = _device->Content(&_content);
        if (FAILED(hr)) {
            ThrowHr("get content interface", hr);
        }
        hr = _content->Properties(&_properties);
        if (FAILED(hr)) {
            ThrowHr("get properties interface", hr);
        }
    }

    ~WpdConnection() override
    {
        _device->Close();
    }

    std::string RootObjectId() const override { return MTP_DEVICE_OBJECT_ID; }
    bool HasDeviceRoot() const override { return true; }
    std::string NativePath(const std::string &objectId) const override
    {
        return objectId == MTP_DEVICE_OBJECT_ID ? _deviceId : objectId;
    }

    std::unique_ptr<MTPObjectCursor> EnumObjects(const std::string &parentId) override
    {
        ComPtr<IEnumPortableDeviceObjectIDs> objects;
        HRESULT hr = _content->EnumObjects(0, MTPWpdBackend::ToWide(parentId).c_str(), nullptr, &objects);
        if (FAILED(hr)) {
            ThrowHr("enumerate children of '" + parentId + "'", hr);
        }
        return std::make_unique<WpdCursor>(std::move(objects), parentId);
    }

    MTPProperties GetProperties(const std::string &objectId) override
    {
        ComPtr<IPortableDeviceValues> values;
        HRESULT hr = _properties->GetValues(MTPWpdBackend::ToWide(objectId).c_str(), PropertyKeys(), &values);
        if (FAILED(hr)) {
            ThrowHr("get properties of '" + objectId + "'", hr);
        }

        MTPProperties props;
        CoTaskString text;
        if (SUCCEEDED(values->GetStringValue(WPD_OBJECT_NAME, &text.text))) {
            props.name = MTPWpdBackend::ToUtf8(text.text);
        } else {
            props.contentType = MTP_CONTENT_DIRECTORY;
        }
        CoTaskString original;
        if (SUCCEEDED(values->GetStringValue(WPD_OBJECT_ORIGINAL_FILE_NAME, &original.text))) {
            props.name = MTPWpdBackend::ToUtf8(original.text);
        }

        if (objectId == MTP_DEVICE_OBJECT_ID) {
            props.contentType = MTP_CONTENT_DEVICE;
            CoTaskString serial;
            if (SUCCEEDED(values->GetStringValue(WPD_DEVICE_SERIAL_NUMBER, &serial.text))) {
                props.serialNumber = MTPWpdBackend::ToUtf8(serial.text);
            }
            return props;
        }

        GUID contentType = GUID_NULL;
        if (FAILED(values->GetGuidValue(WPD_OBJECT_CONTENT_TYPE, &contentType))) {
            if (props.contentType == MTP_CONTENT_UNDEFINED) {
                props.contentType = MTP_CONTENT_FILE;
            }
            return props;
        }

        if (IsEqualGUID(contentType, WPD_CONTENT_TYPE_FUNCTIONAL_OBJECT)
            || IsEqualGUID(contentType, WPD_FUNCTIONAL_CATEGORY_STORAGE)) {
            props.contentType = MTP_CONTENT_STORAGE;
            ULONGLONG value = 0;
            if (SUCCEEDED(values->GetUnsignedLargeIntegerValue(WPD_STORAGE_CAPACITY, &value))) {
                props.capacity = static_cast<int64_t>(value);
            }
            if (SUCCEEDED(values->GetUnsignedLargeIntegerValue(WPD_STORAGE_FREE_SPACE_IN_BYTES, &value))) {
                props.freeCapacity = static_cast<int64_t>(value);
            }
            CoTaskString serial;
            if (SUCCEEDED(values->GetStringValue(WPD_DEVICE_SERIAL_NUMBER, &serial.text))) {
                props.serialNumber = MTPWpdBackend::ToUtf8(serial.text);
            }
        } else if (IsEqualGUID(contentType, WPD_CONTENT_TYPE_FOLDER)) {
            props.contentType = MTP_CONTENT_DIRECTORY;
        } else {
            props.contentType = MTP_CONTENT_FILE;
            ULONGLONG size = 0;
            if (SUCCEEDED(values->GetUnsignedLargeIntegerValue(WPD_OBJECT_SIZE, &size))) {
                props.size = static_cast<int64_t>(size);
            }
            PropVariant modified;
            if (SUCCEEDED(values->GetValue(WPD_OBJECT_DATE_MODIFIED, &modified.value))
                && modified.value.vt == VT_DATE) {
                props.modified = VariantDateToTime(modified.value.date);
            }
        }
        return props;
    }

    std::string CreateFolder(const std::string &parentId, const std::string &name) override
    {
        auto values = NewObjectValues(parentId, name, WPD_CONTENT_TYPE_FOLDER, 0);
        CoTaskString newId;
        HRESULT hr = _content->CreateObjectWithPropertiesOnly(values.Get(), &newId.text);
        if (FAILED(hr)) {
            ThrowHr("create folder '" + name + "' in '" + parentId + "'", hr);
        }
        return MTPWpdBackend::ToUtf8(newId.text);
    }

    void PutObject(const std::string &parentId, const std::string &name,
                   uint64_t length, MTPByteSource &source) override
    {
        auto values = NewObjectValues(parentId, name, WPD_CONTENT_TYPE_GENERIC_FILE, length);
        ComPtr<IStream> stream;
        DWORD optimal = 0;
        HRESULT hr = _content->CreateObjectWithPropertiesAndData(values.Get(), &stream, &optimal, nullptr);
        if (FAILED(hr)) {
            ThrowHr("create file '" + name + "' in '" + parentId + "'", hr);
        }

        std::vector<char> block(optimal ? optimal : 64 * 1024);
        try {
            for (;;) {
                size_t got = source.Read(block.data(), block.size());
                if (got == 0) {
                    break;
                }
                ULONG written = 0;
                hr = stream->Write(block.data(), static_cast<ULONG>(got), &written);
                if (FAILED(hr)) {
                    ThrowHr("write '" + name + "'", hr);
                }
                if (written != got) {
                    throw MTPTransportError("write '" + name + "': short write", EIO);
                }
            }
        } catch (const MTPError &) {
            stream->Revert();
            throw;
        }
        hr = stream->Commit(STGC_DEFAULT);
        if (FAILED(hr)) {
            ThrowHr("commit '" + name + "'", hr);
        }
    }

    void GetObject(const std::string &objectId, MTPByteSink &sink) override
    {
        ComPtr<IPortableDeviceResources> resources;
        HRESULT hr = _content->Transfer(&resources);
        if (FAILED(hr)) {
            ThrowHr("get transfer interface", hr);
        }
        ComPtr<IStream> stream;
        DWORD optimal = 0;
        hr = resources->GetStream(MTPWpdBackend::ToWide(objectId).c_str(), WPD_RESOURCE_DEFAULT, STGM_READ,
                                  &optimal, &stream);
        if (FAILED(hr)) {
            ThrowHr("open '" + objectId + "' for reading", hr);
        }
        std::vector<char> block(optimal ? optimal : 64 * 1024);
        for (;;) {
            ULONG got = 0;
            hr = stream->Read(block.data(), static_cast<ULONG>(block.size()), &got);
            if (FAILED(hr)) {
                ThrowHr("read '" + objectId + "'", hr);
            }
            if (got == 0) {
                break;
            }
            sink.Write(block.data(), got);
        }
    }

    void DeleteObject(const std::string &objectId, MTPDeleteMode mode) override
    {
        ComPtr<IPortableDevicePropVariantCollection> ids;
        HRESULT hr = CoCreateInstance(CLSID_PortableDevicePropVariantCollection, nullptr, CLSCTX_INPROC_SERVER,
                                      IID_PPV_ARGS(&ids));
        if (FAILED(hr)) {
            ThrowHr("create object id collection", hr);
        }
        std::wstring wid = MTPWpdBackend::ToWide(objectId);
        PROPVARIANT pv;
        PropVariantInit(&pv);
        pv.vt = VT_LPWSTR;
        pv.pwszVal = const_cast<LPWSTR>(wid.c_str());
        hr = ids->Add(&pv);
        if (FAILED(hr)) {
            ThrowHr("add object id", hr);
        }

        ComPtr<IPortableDevicePropVariantCollection> results;
        DWORD options = mode == MTP_DELETE_WITH_RECURSION ? PORTABLE_DEVICE_DELETE_WITH_RECURSION
                                                          : PORTABLE_DEVICE_DELETE_NO_RECURSION;
        hr = _content->Delete(options, ids.Get(), &results);
        if (results) {
            DWORD count = 0;
            results->GetCount(&count);
            for (DWORD i = 0; i < count; i++) {
                PropVariant status;
                if (SUCCEEDED(results->GetAt(i, &status.value)) && status.value.vt == VT_ERROR
                    && FAILED(status.value.scode)) {
                    DBG("Delete of '%s' reported partial failure 0x%08lx", objectId.c_str(),
                        static_cast<unsigned long>(status.value.scode));
                }
            }
        }
        // S_FALSE only signals that some sub-objects failed
        if (FAILED(hr)) {
            ThrowHr("delete '" + objectId + "'", hr);
        }
    }
};

}

MTPWpdBackend::MTPWpdBackend(const MTPConfig &config)
    : _config(config)
{
    InitializeCom();
    HRESULT hr = CoCreateInstance(CLSID_PortableDeviceManager, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&_manager));
    if (FAILED(hr)) {
        ThrowHr("create portable device manager", hr);
    }
}

std::vector<std::string> MTPWpdBackend::EnumerateDevices()
{
    std::vector<std::string> devices;
    DWORD count = 0;
    HRESULT hr = _manager->RefreshDeviceList();
    if (FAILED(hr)) {
        DBG("RefreshDeviceList failed: 0x%08lx", static_cast<unsigned long>(hr));
    }
    hr = _manager->GetDevices(nullptr, &count);
    if (FAILED(hr)) {
        ThrowHr("count portable devices", hr);
    }
    if (count == 0) {
        return devices;
    }
    std::vector<LPWSTR> ids(count, nullptr);
    hr = _manager->GetDevices(ids.data(), &count);
    if (FAILED(hr)) {
        ThrowHr("list portable devices", hr);
    }
    for (DWORD i = 0; i < count; i++) {
        if (ids[i]) {
            devices.push_back(ToUtf8(ids[i]));
            CoTaskMemFree(ids[i]);
        }
    }
    return devices;
}

std::unique_ptr<MTPConnection> MTPWpdBackend::OpenDevice(const std::string &deviceId)
{
    ComPtr<IPortableDevice> device;
    HRESULT hr = CoCreateInstance(CLSID_PortableDeviceFTM, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&device));
    if (FAILED(hr)) {
        ThrowHr("create portable device", hr);
    }
    hr = device->Open(ToWide(deviceId).c_str(), ClientInformation().Get());
    if (hr == E_ACCESSDENIED) {
        // Retry read-only for devices that refuse write access
        auto info = ClientInformation();
        info->SetUnsignedIntegerValue(WPD_CLIENT_DESIRED_ACCESS, GENERIC_READ);
        hr = device->Open(ToWide(deviceId).c_str(), info.Get());
    }
    if (FAILED(hr)) {
        ThrowHr("open device '" + deviceId + "'", hr);
    }
    return std::make_unique<WpdConnection>(deviceId, std::move(device));
}

std::string MTPWpdBackend::DeviceDescription(const std::string &deviceId)
{
    std::wstring wid = ToWide(deviceId);
    DWORD length = 0;
    HRESULT hr = _manager->GetDeviceDescription(wid.c_str(), nullptr, &length);
    if (FAILED(hr)) {
        ThrowHr("get device description", hr);
    }
    std::wstring text(length, L'\0');
    hr = _manager->GetDeviceDescription(wid.c_str(), &text[0], &length);
    if (FAILED(hr)) {
        ThrowHr("get device description", hr);
    }
    return ToUtf8(text.c_str());
}

std::string MTPWpdBackend::DeviceFriendlyName(const std::string &deviceId)
{
    std::wstring wid = ToWide(deviceId);
    DWORD length = 0;
    HRESULT hr = _manager->GetDeviceFriendlyName(wid.c_str(), nullptr, &length);
    if (FAILED(hr)) {
        ThrowHr("get device friendly name", hr);
    }
    std::wstring text(length, L'\0');
    hr = _manager->GetDeviceFriendlyName(wid.c_str(), &text[0], &length);
    if (FAILED(hr)) {
        ThrowHr("get device friendly name", hr);
    }
    return ToUtf8(text.c_str());
}

std::string MTPWpdBackend::ToUtf8(const wchar_t *text)
{
    if (!text || !*text) {
        return std::string();
    }
    int size = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
    if (size <= 1) {
        return std::string();
    }
    std::string out(size - 1, '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, -1, &out[0], size, nullptr, nullptr);
    return out;
}

std::wstring MTPWpdBackend::ToWide(const std::string &text)
{
    if (text.empty()) {
        return std::wstring();
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
    if (size <= 1) {
        return std::wstring();
    }
    std::wstring out(size - 1, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, &out[0], size);
    return out;
}

int MTPWpdBackend::HResultToErrno(HRESULT hr)
{
    if (hr == E_ACCESSDENIED || hr == STG_E_ACCESSDENIED) return EACCES;
    if (hr == HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND) || hr == HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND)
        || hr == HRESULT_FROM_WIN32(ERROR_NOT_FOUND)) return ENOENT;
    if (hr == HRESULT_FROM_WIN32(ERROR_BUSY)) return EBUSY;
    if (hr == STG_E_MEDIUMFULL || hr == HRESULT_FROM_WIN32(ERROR_DISK_FULL)) return ENOSPC;
    if (hr == HRESULT_FROM_WIN32(ERROR_ALREADY_EXISTS) || hr == HRESULT_FROM_WIN32(ERROR_FILE_EXISTS)) return EEXIST;
    if (hr == E_NOTIMPL || hr == HRESULT_FROM_WIN32(ERROR_NOT_SUPPORTED)) return ENOTSUP;
    if (hr == E_INVALIDARG) return EINVAL;
    if (hr == HRESULT_FROM_WIN32(ERROR_GEN_FAILURE) || hr == HRESULT_FROM_WIN32(ERROR_DEVICE_NOT_CONNECTED)) return ENODEV;
    return EIO;
}

#include "MTPLibmtpBackend.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPPath.h"
#include "MTPTransfer.h"
#include <mutex>
#include <exception>
#include <algorithm>
#include <string.h>
#include <stdlib.h>
#include <errno.h>

namespace {

struct RawDeviceList {
    LIBMTP_raw_device_t *devices = nullptr;
    int count = 0;

    ~RawDeviceList()
    {
        if (devices) {
            free(devices);
        }
    }
};

struct FileDeleter {
    void operator()(LIBMTP_file_t *file) const { LIBMTP_destroy_file_t(file); }
};
using ScopedMtpFile = std::unique_ptr<LIBMTP_file_t, FileDeleter>;

struct CharDeleter {
    void operator()(char *text) const { free(text); }
};
using ScopedMtpString = std::unique_ptr<char, CharDeleter>;

std::string RawDescription(const LIBMTP_raw_device_t &raw)
{
    std::string vendor = raw.device_entry.vendor ? raw.device_entry.vendor : "";
    std::string product = raw.device_entry.product ? raw.device_entry.product : "";
    if (vendor.empty()) {
        return product;
    }
    return product.empty() ? vendor : vendor + " " + product;
}

// Returns false when no device is attached, throws on real failures
bool DetectRawDevices(RawDeviceList &list)
{
    LIBMTP_error_number_t err = LIBMTP_Detect_Raw_Devices(&list.devices, &list.count);
    if (err == LIBMTP_ERROR_NO_DEVICE_ATTACHED) {
        list.count = 0;
        return false;
    }
    if (err != LIBMTP_ERROR_NONE) {
        DBG("Failed to detect MTP devices: %d", err);
        int code = err == LIBMTP_ERROR_CONNECTING ? EBUSY : EIO;
        throw MTPTransportError("libmtp device detection failed (" + std::to_string(err) + ")", code);
    }
    return true;
}

const LIBMTP_raw_device_t *FindRawDevice(const RawDeviceList &list, const std::string &deviceId)
{
    for (int i = 0; i < list.count; i++) {
        if (MTPLibmtpBackend::EncodeDeviceId(list.devices[i]) == deviceId) {
            return &list.devices[i];
        }
    }
    return nullptr;
}

class LibmtpCursor : public MTPObjectCursor {
private:
    std::vector<std::string> _ids;
    size_t _offset = 0;
    size_t _pageSize;

public:
    LibmtpCursor(std::vector<std::string> ids, size_t pageSize)
        : _ids(std::move(ids))
        , _pageSize(pageSize)
    {
    }

    std::vector<std::string> NextPage() override
    {
        size_t end = std::min(_ids.size(), _offset + _pageSize);
        std::vector<std::string> page(_ids.begin() + _offset, _ids.begin() + end);
        _offset = end;
        return page;
    }
};

struct UploadContext {
    MTPByteSource *source;
    uint64_t remaining;
    std::exception_ptr error;
    bool shortRead = false;
};

uint16_t SourceGetFunc(void *, void *priv, uint32_t wantlen, unsigned char *data, uint32_t *gotlen)
{
    auto *ctx = static_cast<UploadContext *>(priv);
    *gotlen = 0;
    uint32_t want = static_cast<uint32_t>(std::min<uint64_t>(wantlen, ctx->remaining));
    try {
        while (*gotlen < want) {
            size_t got = ctx->source->Read(data + *gotlen, want - *gotlen);
            if (got == 0) {
                ctx->shortRead = true;
                return LIBMTP_HANDLER_RETURN_ERROR;
            }
            *gotlen += static_cast<uint32_t>(got);
        }
    } catch (const std::exception &) {
        ctx->error = std::current_exception();
        return LIBMTP_HANDLER_RETURN_ERROR;
    }
    ctx->remaining -= *gotlen;
    return LIBMTP_HANDLER_RETURN_OK;
}

struct DownloadContext {
    MTPByteSink *sink;
    std::exception_ptr error;
};

uint16_t SinkPutFunc(void *, void *priv, uint32_t sendlen, unsigned char *data, uint32_t *putlen)
{
    auto *ctx = static_cast<DownloadContext *>(priv);
    try {
        ctx->sink->Write(data, sendlen);
    } catch (const std::exception &) {
        ctx->error = std::current_exception();
        *putlen = 0;
        return LIBMTP_HANDLER_RETURN_ERROR;
    }
    *putlen = sendlen;
    return LIBMTP_HANDLER_RETURN_OK;
}

class LibmtpConnection : public MTPConnection {
private:
    std::string _deviceId;
    std::string _rawDescription;
    LIBMTP_mtpdevice_t *_device;
    size_t _pageSize;

    // Collects the libmtp error stack into one diagnostic line
    std::string DrainErrors()
    {
        std::string text;
        for (LIBMTP_error_t *err = LIBMTP_Get_Errorstack(_device); err; err = err->next) {
            if (!err->error_text) {
                continue;
            }
            if (!text.empty()) {
                text += "; ";
            }
            text += err->error_text;
        }
        LIBMTP_Clear_Errorstack(_device);
        return text;
    }

    [[noreturn]] void Fail(const std::string &what, const std::string &objectId)
    {
        std::string detail = DrainErrors();
        int code = detail.empty() ? EIO : MTPError::Str2Errno(detail);
        DBG("%s '%s' failed: %s", what.c_str(), objectId.c_str(), detail.c_str());
        throw MTPTransportError(what + " '" + objectId + "': " + (detail.empty() ? "libmtp error" : detail), code);
    }

    void RefreshStorage()
    {
        if (LIBMTP_Get_Storage(_device, LIBMTP_STORAGE_SORTBY_NOTSORTED) != 0) {
            Fail("get storage", _deviceId);
        }
    }

    const LIBMTP_devicestorage_t *FindStorage(uint32_t storageId) const
    {
        for (LIBMTP_devicestorage_t *storage = _device->storage; storage; storage = storage->next) {
            if (storage->id == storageId) {
                return storage;
            }
        }
        return nullptr;
    }

    // Resolves a folder id into the (storage, parent handle) pair libmtp expects
    void ParentOf(const std::string &parentId, uint32_t &storageId, uint32_t &handle)
    {
        if (MTPLibmtpBackend::DecodeStorageId(parentId, storageId)) {
            handle = LIBMTP_FILES_AND_FOLDERS_ROOT;
            return;
        }
        if (MTPLibmtpBackend::DecodeObjectId(parentId, storageId, handle)) {
            return;
        }
        throw MTPTransportError("'" + parentId + "' cannot hold children", ENOTDIR);
    }

    void DeleteTree(uint32_t storageId, uint32_t handle, std::vector<std::string> &failures)
    {
        uint32_t *children = nullptr;
        int count = LIBMTP_Get_Children(_device, storageId, handle, &children);
        if (count < 0) {
            failures.push_back("list " + MTPLibmtpBackend::EncodeObjectId(storageId, handle) + ": " + DrainErrors());
            return;
        }
        std::vector<uint32_t> handles(children, children + count);
        if (children) {
            free(children);
        }
        for (uint32_t child : handles) {
            DeleteTree(storageId, child, failures);
            if (LIBMTP_Delete_Object(_device, child) != 0) {
                failures.push_back("delete " + MTPLibmtpBackend::EncodeObjectId(storageId, child) + ": " + DrainErrors());
            }
        }
    }

public:
    LibmtpConnection(const std::string &deviceId, const std::string &rawDescription,
                     LIBMTP_mtpdevice_t *device, size_t pageSize)
        : _deviceId(deviceId)
        , _rawDescription(rawDescription)
        , _device(device)
        , _pageSize(pageSize)
    {
        LIBMTP_Dump_Errorstack(_device);
        LIBMTP_Clear_Errorstack(_device);
        // Locked or unauthorized devices report no storage until the user unlocks them
        if (LIBMTP_Get_Storage(_device, LIBMTP_STORAGE_SORTBY_NOTSORTED) != 0) {
            DBG("Storage retrieval failed - device may be unauthorized: %s", DrainErrors().c_str());
        }
    }

    ~LibmtpConnection() override
    {
        DBG("Releasing MTP device %s", _deviceId.c_str());
        LIBMTP_Release_Device(_device);
    }

    std::string RootObjectId() const override { return MTP_DEVICE_OBJECT_ID; }
    bool HasDeviceRoot() const override { return true; }
    std::string NativePath(const std::string &objectId) const override
    {
        return objectId == MTP_DEVICE_OBJECT_ID ? _deviceId : objectId;
    }

    std::unique_ptr<MTPObjectCursor> EnumObjects(const std::string &parentId) override
    {
        std::vector<std::string> ids;
        if (parentId == MTP_DEVICE_OBJECT_ID) {
            RefreshStorage();
            for (LIBMTP_devicestorage_t *storage = _device->storage; storage; storage = storage->next) {
                ids.push_back(MTPLibmtpBackend::EncodeStorageId(storage->id));
            }
            return std::make_unique<LibmtpCursor>(std::move(ids), _pageSize);
        }

        uint32_t storageId = 0, handle = 0;
        ParentOf(parentId, storageId, handle);

        uint32_t *children = nullptr;
        int count = LIBMTP_Get_Children(_device, storageId, handle, &children);
        if (count < 0) {
            Fail("list children", parentId);
        }
        ids.reserve(count);
        for (int i = 0; i < count; i++) {
            ids.push_back(MTPLibmtpBackend::EncodeObjectId(storageId, children[i]));
        }
        if (children) {
            free(children);
        }
        DBG("Object %s has %d children", parentId.c_str(), count);
        return std::make_unique<LibmtpCursor>(std::move(ids), _pageSize);
    }

    MTPProperties GetProperties(const std::string &objectId) override
    {
        MTPProperties props;

        if (objectId == MTP_DEVICE_OBJECT_ID) {
            props.contentType = MTP_CONTENT_DEVICE;
            ScopedMtpString friendly(LIBMTP_Get_Friendlyname(_device));
            if (friendly && *friendly) {
                props.name = friendly.get();
            } else {
                ScopedMtpString model(LIBMTP_Get_Modelname(_device));
                props.name = model && *model ? model.get() : _rawDescription;
            }
            ScopedMtpString serial(LIBMTP_Get_Serialnumber(_device));
            if (serial) {
                props.serialNumber = serial.get();
            }
            return props;
        }

        uint32_t storageId = 0, handle = 0;
        if (MTPLibmtpBackend::DecodeStorageId(objectId, storageId)) {
            RefreshStorage();
            const LIBMTP_devicestorage_t *storage = FindStorage(storageId);
            if (!storage) {
                throw MTPTransportError("storage '" + objectId + "' not found", ENOENT);
            }
            props.name = MTPLibmtpBackend::GetStorageDisplayName(storage);
            props.contentType = MTP_CONTENT_STORAGE;
            props.capacity = static_cast<int64_t>(storage->MaxCapacity);
            props.freeCapacity = static_cast<int64_t>(storage->FreeSpaceInBytes);
            return props;
        }

        if (!MTPLibmtpBackend::DecodeObjectId(objectId, storageId, handle)) {
            throw MTPTransportError("malformed object id '" + objectId + "'", EINVAL);
        }
        ScopedMtpFile file(LIBMTP_Get_Filemetadata(_device, handle));
        if (!file) {
            Fail("get metadata", objectId);
        }
        if (!file->filename) {
            // Objects without a name are treated as virtual folders
            props.contentType = MTP_CONTENT_DIRECTORY;
            return props;
        }
        props.name = file->filename;
        if (file->filetype == LIBMTP_FILETYPE_FOLDER) {
            props.contentType = MTP_CONTENT_DIRECTORY;
        } else {
            props.contentType = MTP_CONTENT_FILE;
            props.size = static_cast<int64_t>(file->filesize);
            props.modified = file->modificationdate;
        }
        return props;
    }

    std::string CreateFolder(const std::string &parentId, const std::string &name) override
    {
        uint32_t storageId = 0, parent = 0;
        ParentOf(parentId, storageId, parent);

        // libmtp may rewrite the name to fit device restrictions
        ScopedMtpString folderName(strdup(name.c_str()));
        uint32_t result = LIBMTP_Create_Folder(_device, folderName.get(), parent, storageId);
        if (result == 0) {
            Fail("create folder '" + name + "' in", parentId);
        }
        DBG("Created folder '%s' with ID %u", name.c_str(), result);
        return MTPLibmtpBackend::EncodeObjectId(storageId, result);
    }

    void PutObject(const std::string &parentId, const std::string &name,
                   uint64_t length, MTPByteSource &source) override
    {
        uint32_t storageId = 0, parent = 0;
        ParentOf(parentId, storageId, parent);

        LIBMTP_file_t metadata;
        memset(&metadata, 0, sizeof(metadata));
        metadata.filename = const_cast<char *>(name.c_str());
        metadata.filesize = length;
        metadata.parent_id = parent;
        metadata.storage_id = storageId;
        metadata.filetype = LIBMTP_FILETYPE_UNKNOWN;

        UploadContext ctx{&source, length, nullptr};
        DBG("Uploading '%s' (%llu bytes) to %s", name.c_str(), (unsigned long long)length, parentId.c_str());
        int result = LIBMTP_Send_File_From_Handler(_device, SourceGetFunc, &ctx, &metadata, nullptr, nullptr);
        if (ctx.error) {
            DrainErrors();
            std::rethrow_exception(ctx.error);
        }
        if (ctx.shortRead) {
            DrainErrors();
            throw MTPTransportError("upload '" + name + "': source ended before the declared length", EIO);
        }
        if (result != 0) {
            Fail("upload '" + name + "' to", parentId);
        }
    }

    void GetObject(const std::string &objectId, MTPByteSink &sink) override
    {
        uint32_t storageId = 0, handle = 0;
        if (!MTPLibmtpBackend::DecodeObjectId(objectId, storageId, handle)) {
            throw MTPTransportError("'" + objectId + "' is not a file", EISDIR);
        }
        DownloadContext ctx{&sink, nullptr};
        int result = LIBMTP_Get_File_To_Handler(_device, handle, SinkPutFunc, &ctx, nullptr, nullptr);
        if (ctx.error) {
            DrainErrors();
            std::rethrow_exception(ctx.error);
        }
        if (result != 0) {
            Fail("download", objectId);
        }
    }

    void DeleteObject(const std::string &objectId, MTPDeleteMode mode) override
    {
        uint32_t storageId = 0, handle = 0;
        if (!MTPLibmtpBackend::DecodeObjectId(objectId, storageId, handle)) {
            throw MTPTransportError("'" + objectId + "' cannot be deleted", EPERM);
        }
        if (mode == MTP_DELETE_WITH_RECURSION) {
            std::vector<std::string> failures;
            DeleteTree(storageId, handle, failures);
            for (const auto &failure : failures) {
                DBG("Recursive delete partial failure: %s", failure.c_str());
            }
        }
        if (LIBMTP_Delete_Object(_device, handle) != 0) {
            Fail("delete", objectId);
        }
        DBG("Deleted %s", objectId.c_str());
    }
};

}

MTPLibmtpBackend::MTPLibmtpBackend(const MTPConfig &config)
    : _config(config)
{
    if (config.pageSize == 0) {
        throw MTPTransportError("libmtp backend needs a non-zero page size", EINVAL);
    }
    InitializeMTP(config.libmtpDebug);
}

void MTPLibmtpBackend::InitializeMTP(int debugLevel)
{
    static std::once_flag initialized;
    std::call_once(initialized, [debugLevel]() {
        DBG("Initializing MTP library");
        LIBMTP_Init();
        if (debugLevel) {
            LIBMTP_Set_Debug(debugLevel);
        }
    });
}

std::string MTPLibmtpBackend::EncodeDeviceId(const LIBMTP_raw_device_t &raw)
{
    return std::to_string(raw.bus_location) + "_" + std::to_string(raw.devnum);
}

std::string MTPLibmtpBackend::EncodeStorageId(uint32_t storageId)
{
    return "S" + MTPPath::IntToHexStr(storageId);
}

std::string MTPLibmtpBackend::EncodeObjectId(uint32_t storageId, uint32_t handle)
{
    return "O" + MTPPath::IntToHexStr(storageId) + MTPPath::IntToHexStr(handle);
}

bool MTPLibmtpBackend::DecodeStorageId(const std::string &encodedId, uint32_t &storageId)
{
    if (encodedId.length() != 9 || encodedId[0] != 'S') {
        return false;
    }
    return MTPPath::HexStrToInt(encodedId.substr(1), storageId);
}

bool MTPLibmtpBackend::DecodeObjectId(const std::string &encodedId, uint32_t &storageId, uint32_t &handle)
{
    if (encodedId.length() != 17 || encodedId[0] != 'O') {
        return false;
    }
    return MTPPath::HexStrToInt(encodedId.substr(1, 8), storageId)
        && MTPPath::HexStrToInt(encodedId.substr(9, 8), handle);
}

std::string MTPLibmtpBackend::GetStorageDisplayName(const LIBMTP_devicestorage_t *storage)
{
    if (!storage) {
        return "Unknown Storage";
    }
    if (storage->StorageDescription && *storage->StorageDescription) {
        return storage->StorageDescription;
    }
    if (storage->VolumeIdentifier && *storage->VolumeIdentifier) {
        return storage->VolumeIdentifier;
    }

    // PTP StorageType: 1/5 fixed RAM, 2/6 removable RAM, 3 fixed ROM, 4 removable ROM
    std::string name;
    switch (storage->StorageType) {
        case 0x0001:
        case 0x0005:
            name = "Phone Memory";
            break;
        case 0x0002:
        case 0x0006:
            name = "External Storage";
            break;
        case 0x0003:
            name = "Internal ROM";
            break;
        case 0x0004:
            name = "External ROM";
            break;
        default:
            name = "Storage";
            break;
    }

    uint64_t capacityGB = storage->MaxCapacity / (1024ull * 1024 * 1024);
    uint64_t capacityMB = storage->MaxCapacity / (1024ull * 1024);
    if (capacityGB > 0) {
        name += " (" + std::to_string(capacityGB) + "GB)";
    } else if (capacityMB > 0) {
        name += " (" + std::to_string(capacityMB) + "MB)";
    }
    return name;
}

std::vector<std::string> MTPLibmtpBackend::EnumerateDevices()
{
    std::vector<std::string> devices;
    RawDeviceList list;
    if (!DetectRawDevices(list)) {
        DBG("No MTP devices found");
        return devices;
    }
    for (int i = 0; i < list.count; i++) {
        devices.push_back(EncodeDeviceId(list.devices[i]));
        DBG("Found MTP device %s: %s", devices.back().c_str(), RawDescription(list.devices[i]).c_str());
    }
    return devices;
}

std::unique_ptr<MTPConnection> MTPLibmtpBackend::OpenDevice(const std::string &deviceId)
{
    RawDeviceList list;
    DetectRawDevices(list);
    const LIBMTP_raw_device_t *raw = FindRawDevice(list, deviceId);
    if (!raw) {
        throw MTPTransportError("device '" + deviceId + "' not found", ENODEV);
    }

    DBG("Opening MTP device (bus: %u, dev: %u)", raw->bus_location, raw->devnum);
    LIBMTP_raw_device_t rawCopy = *raw;
    LIBMTP_mtpdevice_t *device = LIBMTP_Open_Raw_Device_Uncached(&rawCopy);
    if (!device) {
        throw MTPTransportError("device '" + deviceId + "' is busy or not responding", EBUSY);
    }
    return std::make_unique<LibmtpConnection>(deviceId, RawDescription(*raw), device, _config.pageSize);
}

std::string MTPLibmtpBackend::DeviceDescription(const std::string &deviceId)
{
    RawDeviceList list;
    DetectRawDevices(list);
    const LIBMTP_raw_device_t *raw = FindRawDevice(list, deviceId);
    if (!raw) {
        throw MTPTransportError("device '" + deviceId + "' not found", ENODEV);
    }
    return RawDescription(*raw);
}

std::string MTPLibmtpBackend::DeviceFriendlyName(const std::string &deviceId)
{
    throw MTPTransportError("friendly name of '" + deviceId + "' requires an open session", ENOTSUP);
}

#include "MTPGvfsBackend.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPPath.h"
#include "MTPTransfer.h"
#include <algorithm>
#include <string.h>
#include <errno.h>
#include <dirent.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/statvfs.h>

namespace {

struct DirCloser {
    void operator()(DIR *dir) const { closedir(dir); }
};
using ScopedDir = std::unique_ptr<DIR, DirCloser>;

struct FileCloser {
    void operator()(FILE *file) const { fclose(file); }
};
using ScopedFile = std::unique_ptr<FILE, FileCloser>;

[[noreturn]] void ThrowErrno(const std::string &what, const std::string &path, int err)
{
    DBG("%s '%s' failed: %s", what.c_str(), path.c_str(), strerror(err));
    throw MTPTransportError(what + " '" + path + "': " + strerror(err), err);
}

bool IsDotEntry(const char *name)
{
    return strcmp(name, ".") == 0 || strcmp(name, "..") == 0;
}

std::vector<std::string> ListNames(const std::string &path)
{
    std::vector<std::string> names;
    ScopedDir dir(opendir(path.c_str()));
    if (!dir) {
        ThrowErrno("opendir", path, errno);
    }
    while (struct dirent *entry = readdir(dir.get())) {
        if (!IsDotEntry(entry->d_name)) {
            names.emplace_back(entry->d_name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string ParentOf(const std::string &path)
{
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

// Device-side file ends of a transfer, failures are transport errors
class MountFileSource : public MTPByteSource {
private:
    FILE *_file;
    std::string _path;

public:
    MountFileSource(FILE *file, const std::string &path) : _file(file), _path(path) {}

    size_t Read(void *buffer, size_t length) override
    {
        size_t got = fread(buffer, 1, length, _file);
        if (got == 0 && ferror(_file)) {
            ThrowErrno("read", _path, errno ? errno : EIO);
        }
        return got;
    }
};

class MountFileSink : public MTPByteSink {
private:
    FILE *_file;
    std::string _path;

public:
    MountFileSink(FILE *file, const std::string &path) : _file(file), _path(path) {}

    void Write(const void *buffer, size_t length) override
    {
        if (length && fwrite(buffer, 1, length, _file) != length) {
            ThrowErrno("write", _path, errno ? errno : EIO);
        }
    }
};

class GvfsCursor : public MTPObjectCursor {
private:
    std::string _path;
    ScopedDir _dir;
    size_t _pageSize;

public:
    GvfsCursor(const std::string &path, size_t pageSize)
        : _path(path)
        , _dir(opendir(path.c_str()))
        , _pageSize(pageSize)
    {
        if (!_dir) {
            ThrowErrno("opendir", path, errno);
        }
    }

    std::vector<std::string> NextPage() override
    {
        std::vector<std::string> page;
        if (!_dir) {
            return page;
        }
        while (page.size() < _pageSize) {
            errno = 0;
            struct dirent *entry = readdir(_dir.get());
            if (!entry) {
                int err = errno;
                _dir.reset();
                if (err != 0) {
                    ThrowErrno("readdir", _path, err);
                }
                break;
            }
            if (IsDotEntry(entry->d_name)) {
                continue;
            }
            std::string child = MTPPath::Join(_path, entry->d_name);
            struct stat st;
            if (lstat(child.c_str(), &st) != 0) {
                // Removed between readdir and now
                DBG("Skipping '%s': %s", child.c_str(), strerror(errno));
                continue;
            }
            page.push_back(child);
        }
        return page;
    }
};

class GvfsConnection : public MTPConnection {
private:
    std::string _mount;
    MTPGvfsBackend::MountName _mountName;
    size_t _pageSize;
    size_t _blockSize;

    void RemoveTree(const std::string &path, std::vector<std::string> &failures)
    {
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) {
            failures.push_back(path + ": " + strerror(errno));
            return;
        }
        if (S_ISDIR(st.st_mode)) {
            std::vector<std::string> names;
            try {
                names = ListNames(path);
            } catch (const MTPTransportError &e) {
                failures.push_back(e.what());
            }
            for (const auto &name : names) {
                RemoveTree(MTPPath::Join(path, name), failures);
            }
            if (rmdir(path.c_str()) != 0) {
                failures.push_back(path + ": " + strerror(errno));
            }
        } else if (unlink(path.c_str()) != 0) {
            failures.push_back(path + ": " + strerror(errno));
        }
    }

public:
    GvfsConnection(const std::string &mount, const MTPConfig &config)
        : _mount(mount)
        , _mountName(MTPGvfsBackend::ParseMountName(mount))
        , _pageSize(config.pageSize)
        , _blockSize(config.blockSize)
    {
    }

    std::string RootObjectId() const override { return _mount; }
    bool HasDeviceRoot() const override { return false; }
    std::string NativePath(const std::string &objectId) const override { return objectId; }

    std::unique_ptr<MTPObjectCursor> EnumObjects(const std::string &parentId) override
    {
        return std::make_unique<GvfsCursor>(parentId, _pageSize);
    }

    MTPProperties GetProperties(const std::string &objectId) override
    {
        MTPProperties props;
        struct stat st;
        if (stat(objectId.c_str(), &st) != 0) {
            int err = errno;
            if (lstat(objectId.c_str(), &st) != 0) {
                ThrowErrno("stat", objectId, err);
            }
            DBG("'%s' is a dangling link, reported as a file", objectId.c_str());
        }

        if (objectId == _mount) {
            props.name = _mountName.name;
            props.contentType = MTP_CONTENT_DEVICE;
            props.serialNumber = _mountName.serialNumber;
            return props;
        }

        props.name = MTPPath::LastSegment(objectId);
        if (S_ISDIR(st.st_mode) && ParentOf(objectId) == _mount) {
            props.contentType = MTP_CONTENT_STORAGE;
            struct statvfs vfs;
            if (statvfs(objectId.c_str(), &vfs) == 0) {
                props.capacity = static_cast<int64_t>(vfs.f_blocks) * vfs.f_frsize;
                props.freeCapacity = static_cast<int64_t>(vfs.f_bavail) * vfs.f_frsize;
            } else {
                DBG("statvfs '%s' failed: %s", objectId.c_str(), strerror(errno));
            }
        } else if (S_ISDIR(st.st_mode)) {
            props.contentType = MTP_CONTENT_DIRECTORY;
        } else {
            props.contentType = MTP_CONTENT_FILE;
            props.size = st.st_size;
            props.modified = st.st_mtime;
        }
        return props;
    }

    std::string CreateFolder(const std::string &parentId, const std::string &name) override
    {
        std::string path = MTPPath::Join(parentId, name);
        if (mkdir(path.c_str(), 0755) != 0) {
            ThrowErrno("mkdir", path, errno);
        }
        DBG("Created folder '%s'", path.c_str());
        return path;
    }

    void PutObject(const std::string &parentId, const std::string &name,
                   uint64_t length, MTPByteSource &source) override
    {
        std::string path = MTPPath::Join(parentId, name);
        ScopedFile file(fopen(path.c_str(), "wb"));
        if (!file) {
            ThrowErrno("create", path, errno);
        }
        DBG("Writing %llu bytes to '%s'", (unsigned long long)length, path.c_str());

        MountFileSink sink(file.get(), path);
        MTPCopyStream(source, sink, _blockSize);
        if (fclose(file.release()) != 0) {
            ThrowErrno("close", path, errno);
        }
    }

    void GetObject(const std::string &objectId, MTPByteSink &sink) override
    {
        ScopedFile file(fopen(objectId.c_str(), "rb"));
        if (!file) {
            ThrowErrno("open", objectId, errno);
        }
        MountFileSource source(file.get(), objectId);
        uint64_t copied = MTPCopyStream(source, sink, _blockSize);
        DBG("Read %llu bytes from '%s'", (unsigned long long)copied, objectId.c_str());
    }

    void DeleteObject(const std::string &objectId, MTPDeleteMode mode) override
    {
        struct stat st;
        if (lstat(objectId.c_str(), &st) != 0) {
            ThrowErrno("delete", objectId, errno);
        }
        if (!S_ISDIR(st.st_mode)) {
            if (unlink(objectId.c_str()) != 0) {
                ThrowErrno("delete", objectId, errno);
            }
            return;
        }
        if (mode == MTP_DELETE_NO_RECURSION) {
            if (rmdir(objectId.c_str()) != 0) {
                ThrowErrno("delete", objectId, errno);
            }
            return;
        }

        std::vector<std::string> failures;
        RemoveTree(objectId, failures);
        for (const auto &failure : failures) {
            DBG("Recursive delete partial failure: %s", failure.c_str());
        }
        if (access(objectId.c_str(), F_OK) == 0) {
            throw MTPTransportError("delete '" + objectId + "': directory could not be removed", ENOTEMPTY);
        }
    }
};

}

MTPGvfsBackend::MTPGvfsBackend(const MTPConfig &config)
    : _config(config)
    , _root(config.ResolvedGvfsRoot())
{
    if (config.pageSize == 0 || config.blockSize == 0) {
        throw MTPTransportError("gvfs backend needs non-zero page and block sizes", EINVAL);
    }
    DBG("gvfs backend rooted at '%s'", _root.c_str());
}

bool MTPGvfsBackend::HasMtpMounts(const std::string &root)
{
    if (root.empty()) {
        return false;
    }
    ScopedDir dir(opendir(root.c_str()));
    if (!dir) {
        return false;
    }
    while (struct dirent *entry = readdir(dir.get())) {
        if (strncmp(entry->d_name, "mtp:", 4) == 0) {
            return true;
        }
    }
    return false;
}

MTPGvfsBackend::MountName MTPGvfsBackend::ParseMountName(const std::string &mountPath)
{
    MountName result{"Unknown", "Unknown", ""};
    std::string dirname = MTPPath::LastSegment(mountPath);
    size_t eq = dirname.find('=');
    if (eq == std::string::npos) {
        return result;
    }
    std::string deviceName = dirname.substr(eq + 1);
    size_t lastUnderscore = deviceName.find_last_of('_');
    if (lastUnderscore != std::string::npos) {
        result.name = deviceName;
        result.description = deviceName;
        result.serialNumber = deviceName.substr(lastUnderscore + 1);
    }
    return result;
}

std::vector<std::string> MTPGvfsBackend::EnumerateDevices()
{
    std::vector<std::string> devices;
    if (_root.empty()) {
        throw MTPTransportError("no gvfs mount root on this platform", ENOENT);
    }
    for (const auto &name : ListNames(_root)) {
        std::string path = MTPPath::Join(_root, name);
        struct stat st;
        if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            continue;
        }
        std::vector<std::string> children;
        try {
            children = ListNames(path);
        } catch (const MTPTransportError &e) {
            DBG("Skipping mount '%s': %s", path.c_str(), e.what());
            continue;
        }
        if (!children.empty()) {
            DBG("Found device mount '%s'", path.c_str());
            devices.push_back(path);
            break;
        }
    }
    return devices;
}

std::unique_ptr<MTPConnection> MTPGvfsBackend::OpenDevice(const std::string &deviceId)
{
    struct stat st;
    if (stat(deviceId.c_str(), &st) != 0) {
        ThrowErrno("open device", deviceId, errno);
    }
    if (!S_ISDIR(st.st_mode)) {
        ThrowErrno("open device", deviceId, ENOTDIR);
    }
    return std::make_unique<GvfsConnection>(deviceId, _config);
}

std::string MTPGvfsBackend::DeviceDescription(const std::string &deviceId)
{
    return ParseMountName(deviceId).description;
}

std::string MTPGvfsBackend::DeviceFriendlyName(const std::string &deviceId)
{
    return ParseMountName(deviceId).name;
}

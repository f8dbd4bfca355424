#include "MTPContent.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPPath.h"
#include "MTPTransfer.h"
#include <stdio.h>
#include <inttypes.h>

namespace {

[[noreturn]] void Rethrow(const MTPTransportError &e, const std::string &operation, const std::string &path)
{
    DBG("%s '%s': %s", operation.c_str(), path.c_str(), e.what());
    throw MTPContentIOError(operation + " '" + path + "': " + e.what(), e.Code());
}

}

MTPContentIterator::MTPContentIterator(std::shared_ptr<MTPConnection> connection, const std::string &parentPath,
                                       std::unique_ptr<MTPObjectCursor> cursor)
    : _connection(std::move(connection))
    , _parentPath(parentPath)
    , _cursor(std::move(cursor))
{
}

bool MTPContentIterator::Next(MTPContentPtr &child)
{
    while (_index >= _page.size()) {
        if (!_cursor) {
            return false;
        }
        try {
            _page = _cursor->NextPage();
        } catch (const MTPTransportError &e) {
            _cursor.reset();
            _page.clear();
            _index = 0;
            Rethrow(e, "list children of", _parentPath);
        }
        _index = 0;
        if (_page.empty()) {
            // Release native enumeration resources as soon as the run is over
            _cursor.reset();
            return false;
        }
    }
    child = std::make_shared<MTPContent>(_connection, _page[_index++], _parentPath);
    return true;
}

MTPContent::MTPContent(std::shared_ptr<MTPConnection> connection, const std::string &objectId,
                       const std::string &parentPath)
    : _connection(std::move(connection))
    , _objectId(objectId)
    , _parentPath(parentPath)
{
}

MTPContentPtr MTPContent::CreateRoot(std::shared_ptr<MTPConnection> connection, const std::string &objectId,
                                     const std::string &fullPath)
{
    auto root = std::make_shared<MTPContent>(std::move(connection), objectId, std::string());
    root->_fixedPath = fullPath;
    return root;
}

MTPContentPtr MTPContent::WithFullPath(const std::string &fullPath) const
{
    auto copy = std::make_shared<MTPContent>(_connection, _objectId, _parentPath);
    copy->_fixedPath = fullPath;
    copy->_properties = _properties;
    return copy;
}

const MTPProperties &MTPContent::GetProperties() const
{
    if (!_properties) {
        try {
            _properties = _connection->GetProperties(_objectId);
        } catch (const MTPTransportError &e) {
            Rethrow(e, "get properties of", PathForErrors());
        }
    }
    return *_properties;
}

std::string MTPContent::GetFullPath() const
{
    if (_fixedPath) {
        return *_fixedPath;
    }
    return MTPPath::Join(_parentPath, GetName());
}

std::string MTPContent::PathForErrors() const
{
    if (_fixedPath) {
        return *_fixedPath;
    }
    if (_properties) {
        return MTPPath::Join(_parentPath, _properties->name);
    }
    return MTPPath::Join(_parentPath, "<" + _objectId + ">");
}

void MTPContent::RequireContainer(const char *operation) const
{
    MTPContentType type = GetContentType();
    if (type != MTP_CONTENT_STORAGE && type != MTP_CONTENT_DIRECTORY) {
        throw MTPContentIOError(std::string(operation) + " '" + GetFullPath() + "': not a directory", ENOTDIR);
    }
}

void MTPContent::ValidateName(const std::string &name, const char *operation)
{
    if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos
        || name == "." || name == "..") {
        throw MTPContentIOError(std::string(operation) + ": invalid name '" + name + "'", EINVAL);
    }
}

MTPContentIterator MTPContent::GetChildren() const
{
    const std::string path = GetFullPath();
    if (GetContentType() == MTP_CONTENT_FILE) {
        return MTPContentIterator(_connection, path, nullptr);
    }
    std::unique_ptr<MTPObjectCursor> cursor;
    try {
        cursor = _connection->EnumObjects(_objectId);
    } catch (const MTPTransportError &e) {
        Rethrow(e, "list children of", path);
    }
    return MTPContentIterator(_connection, path, std::move(cursor));
}

std::vector<MTPContentPtr> MTPContent::ListChildren() const
{
    std::vector<MTPContentPtr> children;
    MTPContentIterator it = GetChildren();
    MTPContentPtr child;
    while (it.Next(child)) {
        children.push_back(child);
    }
    return children;
}

MTPContentPtr MTPContent::GetChild(const std::string &name) const
{
    MTPContentIterator it = GetChildren();
    MTPContentPtr child;
    while (it.Next(child)) {
        if (child->GetName() == name) {
            return child;
        }
    }
    return nullptr;
}

MTPContentPtr MTPContent::GetPath(const std::string &path) const
{
    std::vector<std::string> segments = MTPPath::Split(path);
    if (segments.empty()) {
        return WithFullPath(GetFullPath());
    }
    MTPContentPtr current;
    for (const auto &segment : segments) {
        current = current ? current->GetChild(segment) : GetChild(segment);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

void MTPContent::CreateContent(const std::string &name)
{
    ValidateName(name, "create directory");
    RequireContainer("create directory in");
    const std::string path = MTPPath::Join(GetFullPath(), name);
    try {
        std::string newId = _connection->CreateFolder(_objectId, name);
        DBG("Created '%s' as %s", path.c_str(), newId.c_str());
    } catch (const MTPTransportError &e) {
        Rethrow(e, "create directory", path);
    }
}

void MTPContent::UploadStream(const std::string &name, MTPByteSource &source, uint64_t length)
{
    ValidateName(name, "upload");
    RequireContainer("upload into");
    const std::string path = MTPPath::Join(GetFullPath(), name);

    MTPLimitedSource limited(source, length);
    try {
        _connection->PutObject(_objectId, name, length, limited);
    } catch (const MTPTransportError &e) {
        Rethrow(e, "upload", path);
    }
    if (limited.Remaining() != 0) {
        DBG("Upload of '%s' stopped %" PRIu64 " bytes short", path.c_str(), limited.Remaining());
        throw MTPContentIOError("upload '" + path + "': source ended before the declared length", EIO);
    }
    DBG("Uploaded %" PRIu64 " bytes to '%s'", length, path.c_str());
}

void MTPContent::UploadFile(const std::string &name, const std::string &localPath)
{
    MTPLocalFile file(localPath, "rb");
    int64_t length = file.Size();
    MTPFileSource source(file.Get());
    UploadStream(name, source, static_cast<uint64_t>(length));
    file.Close();
}

void MTPContent::DownloadStream(MTPByteSink &sink) const
{
    const std::string path = GetFullPath();
    if (GetContentType() != MTP_CONTENT_FILE) {
        throw MTPContentIOError("download '" + path + "': not a file", EISDIR);
    }
    try {
        _connection->GetObject(_objectId, sink);
    } catch (const MTPTransportError &e) {
        Rethrow(e, "download", path);
    }
}

void MTPContent::DownloadFile(const std::string &localPath) const
{
    MTPLocalFile file(localPath, "wb");
    MTPFileSink sink(file.Get());
    DownloadStream(sink);
    file.Close();
}

void MTPContent::Remove()
{
    const std::string path = GetFullPath();
    MTPDeleteMode mode = GetContentType() == MTP_CONTENT_FILE ? MTP_DELETE_NO_RECURSION : MTP_DELETE_WITH_RECURSION;
    try {
        _connection->DeleteObject(_objectId, mode);
    } catch (const MTPTransportError &e) {
        Rethrow(e, "remove", path);
    }
    DBG("Removed '%s'", path.c_str());
}

std::string MTPContent::Describe() const
{
    std::string text = "<MTPContent " + _objectId + ": ";
    try {
        const MTPProperties &props = GetProperties();
        char numbers[128];
        snprintf(numbers, sizeof(numbers), ", %" PRId64 ", %lld, %" PRId64 ", %" PRId64 ", '",
                 props.size, (long long)props.modified, props.capacity, props.freeCapacity);
        text += "('" + props.name + "', " + MTPContentTypeName(props.contentType) + numbers
            + props.serialNumber + "')>";
    } catch (const MTPContentIOError &e) {
        text += std::string("unresolved: ") + e.what() + ">";
    }
    return text;
}

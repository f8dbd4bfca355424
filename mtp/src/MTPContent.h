#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "MTPTypes.h"
#include "MTPBackend.h"

class MTPContent;
class MTPByteSource;
class MTPByteSink;
using MTPContentPtr = std::shared_ptr<MTPContent>;

// Lazy, single-pass sequence of the children of one content node.
// Pages are fetched from the backend only when the previous one is used up.
class MTPContentIterator {
private:
    std::shared_ptr<MTPConnection> _connection;
    std::string _parentPath;
    std::unique_ptr<MTPObjectCursor> _cursor;
    std::vector<std::string> _page;
    size_t _index = 0;

public:
    MTPContentIterator(std::shared_ptr<MTPConnection> connection, const std::string &parentPath,
                       std::unique_ptr<MTPObjectCursor> cursor);

    // Returns false once the enumeration is exhausted
    bool Next(MTPContentPtr &child);
};

// One storage, directory, file or device-root object on a device.
// Identity is the backend object id. The full path is derived from the
// parent path and the resolved name.
class MTPContent {
private:
    std::shared_ptr<MTPConnection> _connection;
    std::string _objectId;
    std::string _parentPath;
    std::optional<std::string> _fixedPath;
    mutable std::optional<MTPProperties> _properties;

    std::string PathForErrors() const;
    void RequireContainer(const char *operation) const;
    static void ValidateName(const std::string &name, const char *operation);

public:
    MTPContent(std::shared_ptr<MTPConnection> connection, const std::string &objectId,
               const std::string &parentPath);

    // A node whose full path is given instead of derived from its name
    static MTPContentPtr CreateRoot(std::shared_ptr<MTPConnection> connection, const std::string &objectId,
                                    const std::string &fullPath);
    MTPContentPtr WithFullPath(const std::string &fullPath) const;

    const std::string &GetObjectId() const { return _objectId; }

    // First call performs one backend round-trip, later calls are served from cache
    const MTPProperties &GetProperties() const;
    const std::string &GetName() const { return GetProperties().name; }
    MTPContentType GetContentType() const { return GetProperties().contentType; }
    std::string GetFullPath() const;

    // Children are produced fresh on every call
    MTPContentIterator GetChildren() const;
    std::vector<MTPContentPtr> ListChildren() const;

    // Case-sensitive; nullptr when absent
    MTPContentPtr GetChild(const std::string &name) const;
    MTPContentPtr GetPath(const std::string &path) const;

    void CreateContent(const std::string &name);

    void UploadStream(const std::string &name, MTPByteSource &source, uint64_t length);
    void UploadFile(const std::string &name, const std::string &localPath);
    void DownloadStream(MTPByteSink &sink) const;
    void DownloadFile(const std::string &localPath) const;

    // Files are deleted alone, anything else together with its subtree
    void Remove();

    std::string Describe() const;
};

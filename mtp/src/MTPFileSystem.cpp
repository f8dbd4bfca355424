#include "MTPFileSystem.h"
#include "MTPDevice.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPPath.h"

MTPFileSystem::MTPFileSystem(std::shared_ptr<MTPDevice> device)
    : _device(std::move(device))
{
}

MTPContentPtr MTPFileSystem::GetContentFromDevicePath(const std::string &path)
{
    std::vector<std::string> segments = MTPPath::Split(path);
    if (segments.empty() || segments[0] != _device->GetName()) {
        DBG("'%s' is not on device '%s'", path.c_str(), _device->GetName().c_str());
        return nullptr;
    }

    MTPContentPtr current = _device->GetRootContent();
    for (size_t i = 1; i < segments.size() && current; i++) {
        current = current->GetChild(segments[i]);
    }
    return current;
}

MTPContentPtr MTPFileSystem::MakeDirs(const std::string &path)
{
    std::vector<std::string> segments = MTPPath::Split(path);
    if (segments.empty()) {
        throw MTPContentIOError("create directories: empty path", EINVAL);
    }

    try {
        MTPContentPtr content;
        std::string prefix;
        for (const auto &segment : segments) {
            prefix = MTPPath::Join(prefix, segment);
            MTPContentPtr target = GetContentFromDevicePath(prefix);
            if (!target) {
                if (!content) {
                    throw MTPContentIOError("create directory '" + prefix + "': no parent to create it in", ENOENT);
                }
                DBG("Creating missing directory '%s'", prefix.c_str());
                content->CreateContent(segment);
                // The create call yields no node, resolve it again to learn its identity
                target = GetContentFromDevicePath(prefix);
                if (!target) {
                    throw MTPContentIOError("create directory '" + prefix + "': created but not found", EIO);
                }
            }
            content = target;
        }
        return content;
    } catch (const MTPDeviceAccessError &e) {
        throw MTPContentIOError("create directories '" + path + "': " + e.what(), e.Code());
    }
}

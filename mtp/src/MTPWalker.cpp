#include "MTPWalker.h"
#include "MTPDevice.h"
#include "MTPFileSystem.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include "MTPPath.h"
#include <algorithm>

MTPWalker::MTPWalker(std::shared_ptr<MTPDevice> device, const std::string &path,
                     MTPWalkCallback callback, MTPWalkErrorCallback errorCallback)
    : _device(std::move(device))
    , _path(path)
    , _callback(std::move(callback))
    , _errorCallback(std::move(errorCallback))
{
}

void MTPWalker::Start()
{
    _started = true;
    MTPFileSystem fs(_device);
    MTPContentPtr root = fs.GetContentFromDevicePath(_path);
    if (!root) {
        DBG("Walk root '%s' not found", _path.c_str());
        return;
    }
    if (root->GetContentType() == MTP_CONTENT_FILE) {
        DBG("Walk root '%s' is a file", _path.c_str());
        return;
    }
    // Report the root under the path the caller used
    _queue.push_back(root->WithFullPath(MTPPath::Normalize(_path)));
}

bool MTPWalker::Next(MTPWalkEntry &entry)
{
    if (!_started) {
        Start();
    }

    auto byPath = [](const MTPContentPtr &a, const MTPContentPtr &b) {
        return a->GetFullPath() < b->GetFullPath();
    };

    while (!_aborted && !_queue.empty()) {
        MTPContentPtr current = _queue.front();
        _queue.pop_front();

        std::vector<MTPContentPtr> directories;
        std::vector<MTPContentPtr> files;
        try {
            MTPContentIterator it = current->GetChildren();
            MTPContentPtr child;
            while (it.Next(child)) {
                if (_callback && !_callback(child->GetFullPath())) {
                    DBG("Walk cancelled at '%s'", child->GetFullPath().c_str());
                    _aborted = true;
                    _queue.clear();
                    return false;
                }
                switch (child->GetContentType()) {
                    case MTP_CONTENT_STORAGE:
                    case MTP_CONTENT_DIRECTORY:
                        directories.push_back(child);
                        break;
                    case MTP_CONTENT_FILE:
                        files.push_back(child);
                        break;
                    default:
                        break;
                }
            }
        } catch (const MTPContentIOError &e) {
            if (_errorCallback) {
                if (!_errorCallback(e.what())) {
                    DBG("Walk aborted by error callback: %s", e.what());
                    _aborted = true;
                    _queue.clear();
                    return false;
                }
            } else {
                DBG("Skipping '%s': %s", current->GetFullPath().c_str(), e.what());
            }
            continue;
        }

        std::sort(directories.begin(), directories.end(), byPath);
        std::sort(files.begin(), files.end(), byPath);
        _queue.insert(_queue.end(), directories.begin(), directories.end());

        entry.path = current->GetFullPath();
        entry.directories = std::move(directories);
        entry.files = std::move(files);
        return true;
    }
    return false;
}

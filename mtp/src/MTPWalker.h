#pragma once

#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <functional>
#include "MTPContent.h"

class MTPDevice;

struct MTPWalkEntry {
    std::string path;
    std::vector<MTPContentPtr> directories;
    std::vector<MTPContentPtr> files;
};

// Return false to stop the walk
using MTPWalkCallback = std::function<bool(const std::string &fullPath)>;
using MTPWalkErrorCallback = std::function<bool(const std::string &message)>;

// Breadth-first traversal yielding (directory, subdirectories, files) per directory.
// Both lists are sorted by full path. The walk is single-pass.
class MTPWalker {
private:
    std::shared_ptr<MTPDevice> _device;
    std::string _path;
    MTPWalkCallback _callback;
    MTPWalkErrorCallback _errorCallback;
    std::deque<MTPContentPtr> _queue;
    bool _started = false;
    bool _aborted = false;

    void Start();

public:
    MTPWalker(std::shared_ptr<MTPDevice> device, const std::string &path,
              MTPWalkCallback callback = nullptr, MTPWalkErrorCallback errorCallback = nullptr);

    // Fills entry with the next directory; false when the walk is over
    bool Next(MTPWalkEntry &entry);

    bool Aborted() const { return _aborted; }
};

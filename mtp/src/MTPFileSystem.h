#pragma once

#include <string>
#include <memory>
#include "MTPContent.h"

class MTPDevice;

// Path-level operations on one device. Paths start with the device name,
// e.g. "Pixel 7/Internal shared storage/DCIM".
class MTPFileSystem {
private:
    std::shared_ptr<MTPDevice> _device;

public:
    explicit MTPFileSystem(std::shared_ptr<MTPDevice> device);

    const std::shared_ptr<MTPDevice> &GetDevice() const { return _device; }

    // nullptr when the first segment is not the device name or a segment is missing
    MTPContentPtr GetContentFromDevicePath(const std::string &path);

    // Creates every missing directory along path, returns the deepest one
    MTPContentPtr MakeDirs(const std::string &path);
};

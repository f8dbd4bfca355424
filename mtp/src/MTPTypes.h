#pragma once

#include <string>
#include <stdint.h>
#include <time.h>

// Stable integer values, external tools branch on them
enum MTPContentType {
    MTP_CONTENT_UNDEFINED = -1,
    MTP_CONTENT_STORAGE = 0,
    MTP_CONTENT_DIRECTORY = 1,
    MTP_CONTENT_FILE = 2,
    MTP_CONTENT_DEVICE = 3
};

enum MTPDeleteMode {
    MTP_DELETE_NO_RECURSION = 0,
    MTP_DELETE_WITH_RECURSION = 1
};

const char *MTPContentTypeName(MTPContentType type);

// Attributes that do not apply to a content type keep their sentinel
struct MTPProperties {
    std::string name;
    MTPContentType contentType = MTP_CONTENT_UNDEFINED;
    int64_t size = -1;
    time_t modified = 0;
    int64_t capacity = -1;
    int64_t freeCapacity = -1;
    std::string serialNumber;
};

struct MTPDeviceDescription {
    std::string name;
    std::string description;
};

// Identifier of the synthetic device-root object
#define MTP_DEVICE_OBJECT_ID "DEVICE"

#include "MTPTypes.h"

const char *MTPContentTypeName(MTPContentType type)
{
    switch (type) {
        case MTP_CONTENT_STORAGE: return "Storage";
        case MTP_CONTENT_DIRECTORY: return "Directory";
        case MTP_CONTENT_FILE: return "File";
        case MTP_CONTENT_DEVICE: return "Device";
        default: return "Undefined";
    }
}

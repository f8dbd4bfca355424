#include "MTPErrors.h"
#include <algorithm>
#include <cctype>

MTPError::MTPError(const std::string &message, int code)
    : std::runtime_error(message)
    , _code(code)
{
}

int MTPError::Str2Errno(const std::string &mtpError)
{
    std::string lower(mtpError);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("not found") != std::string::npos) return ENOENT;
    if (lower.find("no such") != std::string::npos) return ENOENT;
    if (lower.find("permission") != std::string::npos) return EACCES;
    if (lower.find("access denied") != std::string::npos) return EACCES;
    if (lower.find("busy") != std::string::npos) return EBUSY;
    if (lower.find("no space") != std::string::npos) return ENOSPC;
    if (lower.find("storage full") != std::string::npos) return ENOSPC;
    if (lower.find("already exists") != std::string::npos) return EEXIST;
    if (lower.find("read-only") != std::string::npos) return EROFS;
    if (lower.find("not supported") != std::string::npos) return ENOTSUP;
    if (lower.find("cancel") != std::string::npos) return ECANCELED;
    if (lower.find("disconnect") != std::string::npos) return ENODEV;
    return EIO;
}

#include "MTPPath.h"
#include <algorithm>
#include <stdio.h>
#include <stdlib.h>

namespace MTPPath {

std::string Normalize(const std::string &path)
{
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::vector<std::string> Split(const std::string &path)
{
    std::vector<std::string> segments;
    const std::string normalized = Normalize(path);
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t end = normalized.find('/', start);
        if (end == std::string::npos) {
            end = normalized.size();
        }
        if (end > start) {
            segments.push_back(normalized.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

std::string Join(const std::string &parent, const std::string &name)
{
    if (parent.empty()) {
        return name;
    }
    if (parent.back() == '/') {
        return parent + name;
    }
    return parent + "/" + name;
}

std::string LastSegment(const std::string &path)
{
    auto segments = Split(path);
    return segments.empty() ? std::string() : segments.back();
}

bool StartsWith(const std::string &path, const std::string &prefix)
{
    return path.size() >= prefix.size() && path.compare(0, prefix.size(), prefix) == 0;
}

std::string IntToHexStr(uint32_t value, int width)
{
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%0*x", width, value);
    return std::string(buffer);
}

bool HexStrToInt(const std::string &hexStr, uint32_t &value)
{
    if (hexStr.empty() || hexStr.size() > 8) {
        return false;
    }
    char *end = nullptr;
    unsigned long parsed = strtoul(hexStr.c_str(), &end, 16);
    if (!end || *end != '\0') {
        return false;
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}

}

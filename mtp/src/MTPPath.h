#pragma once

#include <string>
#include <vector>
#include <stdint.h>

namespace MTPPath {

// Backslashes become '/', the public separator
std::string Normalize(const std::string &path);

// Empty segments ("a//b", leading or trailing '/') are dropped
std::vector<std::string> Split(const std::string &path);

std::string Join(const std::string &parent, const std::string &name);

std::string LastSegment(const std::string &path);

bool StartsWith(const std::string &path, const std::string &prefix);

// Hex helpers shared by the object id encodings
std::string IntToHexStr(uint32_t value, int width = 8);
bool HexStrToInt(const std::string &hexStr, uint32_t &value);

}

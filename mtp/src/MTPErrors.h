#pragma once

#include <string>
#include <stdexcept>
#include <errno.h>

// Base of every error raised by this library. Code() is an errno value.
class MTPError : public std::runtime_error {
private:
    int _code;

public:
    MTPError(const std::string &message, int code = EIO);

    int Code() const { return _code; }

    // Maps backend diagnostic text to the closest errno value
    static int Str2Errno(const std::string &mtpError);
};

// Raised by backends only, caught and rethrown with context by Content/Device
class MTPTransportError : public MTPError {
public:
    using MTPError::MTPError;
};

class MTPDeviceAccessError : public MTPError {
public:
    using MTPError::MTPError;
};

class MTPContentIOError : public MTPError {
public:
    using MTPError::MTPError;
};

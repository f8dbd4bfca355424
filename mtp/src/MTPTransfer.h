#pragma once

#include <string>
#include <vector>
#include <stdio.h>
#include <stddef.h>
#include <stdint.h>

// Pull side of a transfer. Read returns 0 only at end of stream.
class MTPByteSource {
public:
    virtual ~MTPByteSource() = default;
    virtual size_t Read(void *buffer, size_t length) = 0;
};

// Push side of a transfer
class MTPByteSink {
public:
    virtual ~MTPByteSink() = default;
    virtual void Write(const void *buffer, size_t length) = 0;
};

// Owns a local FILE* for the duration of a transfer.
// Close() reports errors, the destructor closes silently on unwinding paths.
class MTPLocalFile {
private:
    FILE *_file;
    std::string _path;

public:
    MTPLocalFile(const std::string &path, const char *mode);
    ~MTPLocalFile();

    MTPLocalFile(const MTPLocalFile &) = delete;
    MTPLocalFile &operator=(const MTPLocalFile &) = delete;

    FILE *Get() const { return _file; }
    const std::string &Path() const { return _path; }
    int64_t Size() const;
    void Close();
};

class MTPFileSource : public MTPByteSource {
private:
    FILE *_file;

public:
    explicit MTPFileSource(FILE *file) : _file(file) {}
    size_t Read(void *buffer, size_t length) override;
};

class MTPFileSink : public MTPByteSink {
private:
    FILE *_file;

public:
    explicit MTPFileSink(FILE *file) : _file(file) {}
    void Write(const void *buffer, size_t length) override;
};

class MTPMemorySource : public MTPByteSource {
private:
    const uint8_t *_data;
    size_t _size;
    size_t _offset = 0;

public:
    MTPMemorySource(const void *data, size_t size)
        : _data(static_cast<const uint8_t *>(data)), _size(size) {}
    explicit MTPMemorySource(const std::string &data)
        : MTPMemorySource(data.data(), data.size()) {}
    size_t Read(void *buffer, size_t length) override;
};

class MTPMemorySink : public MTPByteSink {
private:
    std::string _data;

public:
    void Write(const void *buffer, size_t length) override;
    const std::string &Data() const { return _data; }
};

// Caps an upstream source to a fixed number of bytes
class MTPLimitedSource : public MTPByteSource {
private:
    MTPByteSource &_upstream;
    uint64_t _remaining;

public:
    MTPLimitedSource(MTPByteSource &upstream, uint64_t limit)
        : _upstream(upstream), _remaining(limit) {}
    size_t Read(void *buffer, size_t length) override;
    uint64_t Remaining() const { return _remaining; }
};

// Copies source into sink in blocks of blockSize, returns bytes copied
uint64_t MTPCopyStream(MTPByteSource &source, MTPByteSink &sink, size_t blockSize);

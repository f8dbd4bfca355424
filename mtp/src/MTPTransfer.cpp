#include "MTPTransfer.h"
#include "MTPErrors.h"
#include "MTPLog.h"
#include <string.h>
#include <errno.h>
#include <algorithm>
#include <sys/types.h>
#include <sys/stat.h>

MTPLocalFile::MTPLocalFile(const std::string &path, const char *mode)
    : _file(fopen(path.c_str(), mode))
    , _path(path)
{
    if (!_file) {
        int err = errno;
        DBG("Cannot open local file '%s': %s", path.c_str(), strerror(err));
        throw MTPContentIOError("open '" + path + "': " + strerror(err), err);
    }
}

MTPLocalFile::~MTPLocalFile()
{
    if (_file) {
        fclose(_file);
    }
}

int64_t MTPLocalFile::Size() const
{
    fflush(_file);
#ifdef _WIN32
    struct _stat64 st;
    int result = _fstat64(_fileno(_file), &st);
#else
    struct stat st;
    int result = fstat(fileno(_file), &st);
#endif
    if (result != 0) {
        int err = errno;
        throw MTPContentIOError("stat '" + _path + "': " + strerror(err), err);
    }
    return static_cast<int64_t>(st.st_size);
}

void MTPLocalFile::Close()
{
    if (!_file) {
        return;
    }
    FILE *file = _file;
    _file = nullptr;
    if (fclose(file) != 0) {
        int err = errno;
        throw MTPContentIOError("close '" + _path + "': " + strerror(err), err);
    }
}

size_t MTPFileSource::Read(void *buffer, size_t length)
{
    size_t got = fread(buffer, 1, length, _file);
    if (got == 0 && ferror(_file)) {
        throw MTPContentIOError(std::string("read local file: ") + strerror(errno), EIO);
    }
    return got;
}

void MTPFileSink::Write(const void *buffer, size_t length)
{
    if (length && fwrite(buffer, 1, length, _file) != length) {
        int err = errno ? errno : EIO;
        throw MTPContentIOError(std::string("write local file: ") + strerror(err), err);
    }
}

size_t MTPMemorySource::Read(void *buffer, size_t length)
{
    size_t n = std::min(length, _size - _offset);
    if (n) {
        memcpy(buffer, _data + _offset, n);
        _offset += n;
    }
    return n;
}

void MTPMemorySink::Write(const void *buffer, size_t length)
{
    _data.append(static_cast<const char *>(buffer), length);
}

size_t MTPLimitedSource::Read(void *buffer, size_t length)
{
    if (_remaining == 0) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(length, _remaining));
    size_t got = _upstream.Read(buffer, want);
    _remaining -= got;
    return got;
}

uint64_t MTPCopyStream(MTPByteSource &source, MTPByteSink &sink, size_t blockSize)
{
    std::vector<uint8_t> block(blockSize ? blockSize : 1);
    uint64_t total = 0;
    for (;;) {
        size_t got = source.Read(block.data(), block.size());
        if (got == 0) {
            break;
        }
        sink.Write(block.data(), got);
        total += got;
    }
    return total;
}

#include "MTPLog.h"
#include <time.h>
#include <stdlib.h>
#include <string>
#include <mutex>

#define MTP_LOG_FILE_NAME "mtp_access_debug.log"

static std::string PlatformLogPath()
{
#ifdef _WIN32
    const char *temp = getenv("TEMP");
    std::string dir = temp && *temp ? temp : ".";
    return dir + "\\" MTP_LOG_FILE_NAME;
#else
    return "/tmp/" MTP_LOG_FILE_NAME;
#endif
}

const char *DebugLogDefaultPath(void)
{
    static const std::string path = PlatformLogPath();
    return path.c_str();
}

static std::mutex s_logMutex;
static FILE *s_logFile = nullptr;
static std::string s_logPath = DebugLogDefaultPath();

static bool ReopenLog()
{
    if (s_logFile) {
        fclose(s_logFile);
        s_logFile = nullptr;
    }
    if (s_logPath.empty()) {
        return false;
    }
    s_logFile = fopen(s_logPath.c_str(), "a");
    return s_logFile != nullptr;
}

void DebugLogSetPath(const char *path)
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    s_logPath = path ? path : DebugLogDefaultPath();
    if (s_logFile) {
        fclose(s_logFile);
        s_logFile = nullptr;
    }
}

void DebugLog(const char *format, ...)
{
    std::lock_guard<std::mutex> lock(s_logMutex);
    if (s_logPath.empty()) {
        return;
    }
    if (!s_logFile && !ReopenLog()) {
        return; // Can't open log file, give up silently
    }

    time_t now = time(nullptr);
    struct tm tm_info;
    char timestamp[64];
#ifdef _WIN32
    localtime_s(&tm_info, &now);
#else
    localtime_r(&now, &tm_info);
#endif
    strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_info);

    // The file may have been deleted or rotated underneath us, retry once on a fresh handle
    for (int attempt = 0; attempt < 2; ++attempt) {
        va_list args;
        va_start(args, format);
        bool ok = fprintf(s_logFile, "[%s] ", timestamp) >= 0
            && vfprintf(s_logFile, format, args) >= 0
            && fprintf(s_logFile, "\n") >= 0;
        va_end(args);
        if (ok) {
            fflush(s_logFile);
            return;
        }
        if (!ReopenLog()) {
            return;
        }
    }
}

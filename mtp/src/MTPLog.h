#ifndef MTPLOG_H
#define MTPLOG_H

#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

void DebugLog(const char *format, ...);

// Empty path disables logging, nullptr restores the default location
void DebugLogSetPath(const char *path);

// Platform temp directory, e.g. /tmp/mtp_access_debug.log
const char *DebugLogDefaultPath(void);

#ifdef __cplusplus
}
#endif

// Debug macros
#define DBG(fmt, ...) DebugLog("[%s] " fmt, __FUNCTION__, ##__VA_ARGS__)
#define _DBG(fmt, ...) // Empty macro - removes debug lines when expanded

#endif // MTPLOG_H

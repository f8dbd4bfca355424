#include <gtest/gtest.h>

#include "MTPPath.h"
#include "MTPErrors.h"
#include "MTPTypes.h"
#include "MTPConfig.h"
#include "MTPLog.h"

TEST(MTPPathTest, SplitIgnoresEmptySegments) {
    std::vector<std::string> expected{"Pixel 7", "Internal", "DCIM"};
    ASSERT_EQ(MTPPath::Split("Pixel 7/Internal/DCIM"), expected);
    ASSERT_EQ(MTPPath::Split("/Pixel 7//Internal/DCIM/"), expected);
    ASSERT_TRUE(MTPPath::Split("").empty());
    ASSERT_TRUE(MTPPath::Split("///").empty());
}

TEST(MTPPathTest, BackslashIsASeparator) {
    std::vector<std::string> expected{"HSG1316", "Interner Speicher", "Ringtones"};
    ASSERT_EQ(MTPPath::Split("HSG1316\\Interner Speicher\\Ringtones"), expected);
    ASSERT_EQ(MTPPath::Normalize("a\\b/c"), "a/b/c");
}

TEST(MTPPathTest, Join) {
    ASSERT_EQ(MTPPath::Join("", "Pixel 7"), "Pixel 7");
    ASSERT_EQ(MTPPath::Join("Pixel 7", "Internal"), "Pixel 7/Internal");
    ASSERT_EQ(MTPPath::Join("Pixel 7/", "Internal"), "Pixel 7/Internal");
    ASSERT_EQ(MTPPath::LastSegment("a/b/c/"), "c");
}

TEST(MTPPathTest, StartsWith) {
    ASSERT_TRUE(MTPPath::StartsWith("a/b/c", "a/b"));
    ASSERT_FALSE(MTPPath::StartsWith("a", "a/b"));
}

TEST(MTPPathTest, HexRoundTrip) {
    ASSERT_EQ(MTPPath::IntToHexStr(0x10001), "00010001");
    uint32_t value = 0;
    ASSERT_TRUE(MTPPath::HexStrToInt("00010001", value));
    ASSERT_EQ(value, 0x10001u);

    // Garbage and oversized input is rejected
    ASSERT_FALSE(MTPPath::HexStrToInt("xyz", value));
    ASSERT_FALSE(MTPPath::HexStrToInt("", value));
    ASSERT_FALSE(MTPPath::HexStrToInt("123456789", value));
}

TEST(MTPErrorTest, Str2Errno) {
    ASSERT_EQ(MTPError::Str2Errno("Object not found"), ENOENT);
    ASSERT_EQ(MTPError::Str2Errno("PTP: Permission denied"), EACCES);
    ASSERT_EQ(MTPError::Str2Errno("Device busy"), EBUSY);
    ASSERT_EQ(MTPError::Str2Errno("Storage full"), ENOSPC);
    ASSERT_EQ(MTPError::Str2Errno("something odd"), EIO);
}

TEST(MTPErrorTest, CarriesCode) {
    MTPContentIOError error("upload 'x': storage full", ENOSPC);
    ASSERT_EQ(error.Code(), ENOSPC);
    ASSERT_STREQ(error.what(), "upload 'x': storage full");
}

TEST(MTPTypesTest, StableContentTypeValues) {
    ASSERT_EQ(MTP_CONTENT_UNDEFINED, -1);
    ASSERT_EQ(MTP_CONTENT_STORAGE, 0);
    ASSERT_EQ(MTP_CONTENT_DIRECTORY, 1);
    ASSERT_EQ(MTP_CONTENT_FILE, 2);
    ASSERT_EQ(MTP_CONTENT_DEVICE, 3);
    ASSERT_STREQ(MTPContentTypeName(MTP_CONTENT_FILE), "File");
}

TEST(MTPLogTest, DefaultPathFollowsPlatform) {
    std::string path = DebugLogDefaultPath();
    ASSERT_EQ(MTPPath::LastSegment(path), "mtp_access_debug.log");
#ifdef _WIN32
    ASSERT_FALSE(MTPPath::StartsWith(path, "/tmp/"));
#else
    ASSERT_EQ(path, "/tmp/mtp_access_debug.log");
#endif
    ASSERT_EQ(MTPConfig().logPath, path);
}

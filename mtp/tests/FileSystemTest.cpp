#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "MTPFileSystem.h"
#include "MTPPath.h"
#include "MTPErrors.h"

TEST(MTPFileSystemTest, ResolvesDevicePaths) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);

    auto root = fs.GetContentFromDevicePath("Pixel 7");
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->GetContentType(), MTP_CONTENT_DEVICE);

    const char *paths[] = {"Pixel 7/Internal", "Pixel 7/Internal/A/B", "Pixel 7\\Internal\\A\\a.txt"};
    for (const char *path : paths) {
        auto content = fs.GetContentFromDevicePath(path);
        ASSERT_NE(content, nullptr) << path;
        std::string last = MTPPath::LastSegment(path);
        std::string full = content->GetFullPath();
        ASSERT_EQ(full.substr(full.size() - last.size()), last) << path;
    }
}

TEST(MTPFileSystemTest, WrongDeviceNameIsNotFound) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);
    ASSERT_EQ(fs.GetContentFromDevicePath("Galaxy/Internal"), nullptr);
    ASSERT_EQ(fs.GetContentFromDevicePath(""), nullptr);
    ASSERT_EQ(fs.GetContentFromDevicePath("Pixel 7/Internal/Nope"), nullptr);
}

TEST(MTPFileSystemTest, MakeDirsCreatesMissingDirectories) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);

    auto created = fs.MakeDirs("Pixel 7/Internal/X/Y/Z");
    ASSERT_NE(created, nullptr);
    ASSERT_EQ(created->GetFullPath(), "Pixel 7/Internal/X/Y/Z");
    ASSERT_EQ(fx.backend->tree->createCalls, 3);

    auto resolved = fs.GetContentFromDevicePath("Pixel 7/Internal/X/Y/Z");
    ASSERT_NE(resolved, nullptr);
    ASSERT_EQ(resolved->GetContentType(), MTP_CONTENT_DIRECTORY);
}

TEST(MTPFileSystemTest, MakeDirsIsIdempotent) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);

    fs.MakeDirs("Pixel 7/Internal/A/B/New");
    ASSERT_EQ(fx.backend->tree->createCalls, 1);
    auto again = fs.MakeDirs("Pixel 7/Internal/A/B/New");
    ASSERT_NE(again, nullptr);
    ASSERT_EQ(fx.backend->tree->createCalls, 1);
    ASSERT_EQ(again->GetContentType(), MTP_CONTENT_DIRECTORY);
}

TEST(MTPFileSystemTest, MakeDirsCreationFailure) {
    FakeDeviceFixture fx;
    fx.backend->tree->failCreate.insert("Locked");
    MTPFileSystem fs(fx.device);
    try {
        fs.MakeDirs("Pixel 7/Internal/Locked/Inner");
        FAIL() << "expected MTPContentIOError";
    } catch (const MTPContentIOError &e) {
        ASSERT_EQ(e.Code(), EACCES);
    }
    ASSERT_EQ(fs.GetContentFromDevicePath("Pixel 7/Internal/Locked"), nullptr);
}

TEST(MTPFileSystemTest, MakeDirsOnWrongDevice) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);
    ASSERT_THROW(fs.MakeDirs("Galaxy/Internal/X"), MTPContentIOError);
    ASSERT_THROW(fs.MakeDirs(""), MTPContentIOError);
}

TEST(MTPFileSystemTest, MakeDirsBelowFileFails) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);
    ASSERT_THROW(fs.MakeDirs("Pixel 7/Internal/A/a.txt/sub"), MTPContentIOError);
}

TEST(MTPFileSystemTest, MakeDirsWhenDeviceCannotOpen) {
    FakeDeviceFixture fx;
    fx.device->GetDescription();
    fx.backend->failOpen = true;
    MTPFileSystem fs(fx.device);
    ASSERT_THROW(fs.MakeDirs("Pixel 7/Internal/X"), MTPContentIOError);
}

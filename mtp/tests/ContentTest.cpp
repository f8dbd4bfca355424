#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "MTPFileSystem.h"
#include "MTPErrors.h"

TEST(MTPContentTest, PropertiesAreFetchedOnce) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);
    auto file = fs.GetContentFromDevicePath("Pixel 7/Internal/A/a.txt");
    ASSERT_NE(file, nullptr);

    std::string id = file->GetObjectId();
    int before = fx.backend->tree->propertyCalls[id];
    MTPProperties first = file->GetProperties();
    MTPProperties second = file->GetProperties();
    file->GetFullPath();
    file->GetName();

    ASSERT_EQ(fx.backend->tree->propertyCalls[id], before);
    ASSERT_EQ(first.name, second.name);
    ASSERT_EQ(first.size, second.size);
    ASSERT_EQ(first.modified, second.modified);
    ASSERT_EQ(first.contentType, second.contentType);
}

TEST(MTPContentTest, FreshNodeFetchesOnFirstAccessOnly) {
    auto backend = std::make_shared<FakeBackend>();
    backend->tree->AddStorage("Internal", 100, 50);
    auto connection = std::shared_ptr<MTPConnection>(backend->OpenDevice(backend->deviceId));
    auto root = MTPContent::CreateRoot(connection, connection->RootObjectId(), "Pixel 7");

    ASSERT_EQ(backend->tree->TotalPropertyCalls(), 0);
    root->GetProperties();
    ASSERT_EQ(backend->tree->TotalPropertyCalls(), 1);
    root->GetProperties();
    root->GetContentType();
    ASSERT_EQ(backend->tree->TotalPropertyCalls(), 1);
}

TEST(MTPContentTest, StorageAndFileClassification) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);

    auto storage = fs.GetContentFromDevicePath("Pixel 7/Internal");
    ASSERT_NE(storage, nullptr);
    const MTPProperties &sp = storage->GetProperties();
    ASSERT_EQ(sp.contentType, MTP_CONTENT_STORAGE);
    ASSERT_EQ(sp.size, -1);
    ASSERT_EQ(sp.capacity, 64ll << 30);
    ASSERT_EQ(sp.freeCapacity, 10ll << 30);

    auto file = fs.GetContentFromDevicePath("Pixel 7/Internal/A/a.txt");
    const MTPProperties &fp = file->GetProperties();
    ASSERT_EQ(fp.contentType, MTP_CONTENT_FILE);
    ASSERT_EQ(fp.size, 5);
    ASSERT_EQ(fp.capacity, -1);
    ASSERT_EQ(fp.freeCapacity, -1);

    auto root = fx.device->GetRootContent();
    ASSERT_EQ(root->GetContentType(), MTP_CONTENT_DEVICE);
    ASSERT_EQ(root->GetProperties().serialNumber, "SERIAL123");
}

TEST(MTPContentTest, NamelessNodeBecomesDirectory) {
    FakeDeviceFixture fx;
    std::string id = fx.backend->tree->AddNode(fx.storage, "hidden", MTP_CONTENT_FILE);
    fx.backend->tree->nodes[id].nameless = true;

    auto storage = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal");
    bool found = false;
    for (const auto &child : storage->ListChildren()) {
        if (child->GetObjectId() == id) {
            found = true;
            ASSERT_EQ(child->GetContentType(), MTP_CONTENT_DIRECTORY);
            ASSERT_EQ(child->GetName(), "");
        }
    }
    ASSERT_TRUE(found);
}

TEST(MTPContentTest, ChildrenArePagedLazily) {
    FakeDeviceFixture fx;
    fx.backend->tree->pageSize = 2;
    std::string dir = fx.backend->tree->AddDirectory(fx.storage, "Many");
    for (int i = 0; i < 5; i++) {
        fx.backend->tree->AddFile(dir, "f" + std::to_string(i), "x");
    }
    auto many = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/Many");
    ASSERT_NE(many, nullptr);

    int pagesBefore = fx.backend->tree->pageCalls;
    MTPContentIterator it = many->GetChildren();
    ASSERT_EQ(fx.backend->tree->pageCalls, pagesBefore);

    MTPContentPtr child;
    ASSERT_TRUE(it.Next(child));
    ASSERT_EQ(child->GetFullPath(), "Pixel 7/Internal/Many/f0");
    ASSERT_EQ(fx.backend->tree->pageCalls, pagesBefore + 1);

    int count = 1;
    while (it.Next(child)) {
        count++;
    }
    ASSERT_EQ(count, 5);
    // 2 + 2 + 1 entries, then the empty page that ends the run
    ASSERT_EQ(fx.backend->tree->pageCalls, pagesBefore + 4);
    ASSERT_FALSE(it.Next(child));
}

TEST(MTPContentTest, ChildrenAreNotCached) {
    FakeDeviceFixture fx;
    auto folder = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A");
    auto first = folder->ListChildren();
    auto second = folder->ListChildren();
    ASSERT_EQ(first.size(), second.size());
    ASSERT_NE(first[0].get(), second[0].get());
    ASSERT_EQ(first[0]->GetFullPath(), second[0]->GetFullPath());

    fx.backend->tree->AddFile(fx.backend->tree->Find("Internal/A"), "new.txt", "n");
    ASSERT_EQ(folder->ListChildren().size(), first.size() + 1);
}

TEST(MTPContentTest, GetChildIsCaseSensitive) {
    FakeDeviceFixture fx;
    auto folder = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A");
    ASSERT_NE(folder->GetChild("a.txt"), nullptr);
    ASSERT_EQ(folder->GetChild("A.TXT"), nullptr);
}

TEST(MTPContentTest, GetPathShortCircuits) {
    FakeDeviceFixture fx;
    auto storage = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal");

    auto found = storage->GetPath("A/B/b.txt");
    ASSERT_NE(found, nullptr);
    ASSERT_EQ(found->GetFullPath(), "Pixel 7/Internal/A/B/b.txt");

    int enums = fx.backend->tree->enumCalls;
    ASSERT_EQ(storage->GetPath("A/Missing/b.txt"), nullptr);
    // Only Internal and A were listed, the lookup stopped at the missing segment
    ASSERT_EQ(fx.backend->tree->enumCalls - enums, 2);
}

TEST(MTPContentTest, EnumerationFailureKeepsYieldedChildren) {
    FakeDeviceFixture fx;
    auto folder = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A");
    MTPContentIterator it = folder->GetChildren();
    MTPContentPtr first;
    ASSERT_TRUE(it.Next(first));

    fx.backend->tree->failEnum.insert(folder->GetObjectId());
    MTPContentPtr next;
    bool threw = false;
    try {
        while (it.Next(next)) {
        }
    } catch (const MTPContentIOError &e) {
        threw = true;
        ASSERT_EQ(e.Code(), ENODEV);
    }
    // The first page was already in memory, the failure shows up on the next fetch
    ASSERT_TRUE(threw);
    ASSERT_EQ(first->GetName(), "a.txt");
}

TEST(MTPContentTest, CreateContentValidatesName) {
    FakeDeviceFixture fx;
    auto folder = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A");
    ASSERT_THROW(folder->CreateContent(""), MTPContentIOError);
    ASSERT_THROW(folder->CreateContent("x/y"), MTPContentIOError);
    ASSERT_THROW(folder->CreateContent(".."), MTPContentIOError);
    ASSERT_EQ(fx.backend->tree->createCalls, 0);

    folder->CreateContent("New");
    auto created = folder->GetChild("New");
    ASSERT_NE(created, nullptr);
    ASSERT_EQ(created->GetContentType(), MTP_CONTENT_DIRECTORY);
}

TEST(MTPContentTest, RemoveFileAndDirectory) {
    FakeDeviceFixture fx;
    MTPFileSystem fs(fx.device);

    auto file = fs.GetContentFromDevicePath("Pixel 7/Internal/A/a.txt");
    file->Remove();
    ASSERT_EQ(fs.GetContentFromDevicePath("Pixel 7/Internal/A/a.txt"), nullptr);

    auto dir = fs.GetContentFromDevicePath("Pixel 7/Internal/A");
    dir->Remove();
    ASSERT_EQ(fs.GetContentFromDevicePath("Pixel 7/Internal/A"), nullptr);
    ASSERT_TRUE(fx.backend->tree->Find("Internal/A/B/b.txt").empty());
}

TEST(MTPContentTest, RemoveRejectionIsContentIOError) {
    FakeDeviceFixture fx;
    auto root = fx.device->GetRootContent();
    ASSERT_THROW(root->Remove(), MTPContentIOError);
}

TEST(MTPContentTest, PropertyFailureIsContentIOError) {
    FakeDeviceFixture fx;
    std::string id = fx.backend->tree->Find("Internal/A/B");
    fx.backend->tree->failProperties.insert(id);
    auto folder = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A");
    ASSERT_THROW(folder->GetChild("B"), MTPContentIOError);
}

TEST(MTPContentTest, Describe) {
    FakeDeviceFixture fx;
    auto file = MTPFileSystem(fx.device).GetContentFromDevicePath("Pixel 7/Internal/A/a.txt");
    std::string text = file->Describe();
    ASSERT_NE(text.find("'a.txt', File, 5"), std::string::npos) << text;
}

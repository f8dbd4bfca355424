#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "MTPDeviceManager.h"
#include "MTPErrors.h"

TEST(MTPDeviceManagerTest, ListsDevices) {
    auto backend = std::make_shared<FakeBackend>();
    MTPDeviceManager manager(backend);
    auto devices = manager.ListDevices();
    ASSERT_EQ(devices.size(), 1u);
    ASSERT_EQ(devices[0]->GetDeviceId(), "fake-device-1");

    // Listing does not open a session
    ASSERT_EQ(backend->openCalls, 0);
    ASSERT_FALSE(devices[0]->IsConnected());
}

TEST(MTPDeviceManagerTest, UnreachableRegistry) {
    auto backend = std::make_shared<FakeBackend>();
    backend->failEnumerate = true;
    MTPDeviceManager manager(backend);
    try {
        manager.ListDevices();
        FAIL() << "expected MTPDeviceAccessError";
    } catch (const MTPDeviceAccessError &e) {
        ASSERT_EQ(e.Code(), ENODEV);
    }
}

TEST(MTPDeviceManagerTest, NullBackendIsRejected) {
    ASSERT_THROW(MTPDeviceManager(std::shared_ptr<MTPBackend>()), MTPDeviceAccessError);
}

TEST(MTPDeviceTest, DescriptionIsMemoized) {
    FakeDeviceFixture fx;
    MTPDeviceDescription first = fx.device->GetDescription();
    ASSERT_EQ(first.name, "Pixel 7");
    ASSERT_EQ(first.description, "Generic Pixel 7");

    fx.backend->friendlyName = "Changed";
    MTPDeviceDescription second = fx.device->GetDescription();
    ASSERT_EQ(second.name, "Pixel 7");
    ASSERT_EQ(fx.backend->descriptionCalls, 1);
}

TEST(MTPDeviceTest, NameFallsBackToDeviceObject) {
    FakeDeviceFixture fx;
    fx.backend->failFriendlyName = true;
    fx.backend->tree->nodes[MTP_DEVICE_OBJECT_ID].name = "Object Name";
    MTPDeviceDescription desc = fx.device->GetDescription();
    ASSERT_EQ(desc.name, "Object Name");
    ASSERT_EQ(desc.description, "Generic Pixel 7");
}

TEST(MTPDeviceTest, NameFallsBackToDescription) {
    FakeDeviceFixture fx;
    fx.backend->failFriendlyName = true;
    fx.backend->failOpen = true;
    MTPDeviceDescription desc = fx.device->GetDescription();
    ASSERT_EQ(desc.name, "Generic Pixel 7");
    ASSERT_EQ(desc.description, "Generic Pixel 7");
}

TEST(MTPDeviceTest, DescriptionNeverThrows) {
    FakeDeviceFixture fx;
    fx.backend->failFriendlyName = true;
    fx.backend->failDescription = true;
    fx.backend->failOpen = true;
    MTPDeviceDescription desc;
    ASSERT_NO_THROW(desc = fx.device->GetDescription());
    ASSERT_EQ(desc.name, "");
    ASSERT_EQ(desc.description, "");
}

TEST(MTPDeviceTest, DescriptionDefaultsToName) {
    FakeDeviceFixture fx;
    fx.backend->failDescription = true;
    MTPDeviceDescription desc = fx.device->GetDescription();
    ASSERT_EQ(desc.name, "Pixel 7");
    ASSERT_EQ(desc.description, "Pixel 7");
}

TEST(MTPDeviceTest, SessionIsOpenedOnceOnDemand) {
    FakeDeviceFixture fx;
    ASSERT_EQ(fx.backend->openCalls, 0);
    fx.device->GetContent();
    fx.device->GetContent();
    fx.device->GetRootContent()->ListChildren();
    ASSERT_EQ(fx.backend->openCalls, 1);
    ASSERT_TRUE(fx.device->IsConnected());
}

TEST(MTPDeviceTest, ContentWithDeviceRoot) {
    FakeDeviceFixture fx;
    auto content = fx.device->GetContent();
    ASSERT_EQ(content.size(), 1u);
    ASSERT_EQ(content[0]->GetContentType(), MTP_CONTENT_DEVICE);
    ASSERT_EQ(content[0]->GetFullPath(), "Pixel 7");

    // One more level reaches the storages
    auto storages = content[0]->ListChildren();
    ASSERT_EQ(storages.size(), 1u);
    ASSERT_EQ(storages[0]->GetFullPath(), "Pixel 7/Internal");
}

TEST(MTPDeviceTest, ContentWithoutDeviceRootIsSortedStorages) {
    FakeDeviceFixture fx;
    fx.backend->tree->hasDeviceRoot = false;
    fx.backend->tree->AddStorage("Card", 1000, 10);
    fx.backend->tree->AddStorage("Backup", 1000, 10);

    auto storages = fx.device->GetContent();
    ASSERT_EQ(storages.size(), 3u);
    ASSERT_EQ(storages[0]->GetName(), "Backup");
    ASSERT_EQ(storages[1]->GetName(), "Card");
    ASSERT_EQ(storages[2]->GetName(), "Internal");
    ASSERT_EQ(storages[0]->GetContentType(), MTP_CONTENT_STORAGE);
}

TEST(MTPDeviceTest, OpenFailureIsDeviceAccessError) {
    FakeDeviceFixture fx;
    fx.backend->failOpen = true;
    try {
        fx.device->GetContent();
        FAIL() << "expected MTPDeviceAccessError";
    } catch (const MTPDeviceAccessError &e) {
        ASSERT_EQ(e.Code(), EBUSY);
    }
}

TEST(MTPDeviceTest, StorageListingFailureIsDeviceAccessError) {
    FakeDeviceFixture fx;
    fx.backend->tree->hasDeviceRoot = false;
    fx.backend->tree->failEnum.insert(MTP_DEVICE_OBJECT_ID);
    ASSERT_THROW(fx.device->GetContent(), MTPDeviceAccessError);
}

TEST(MTPDeviceTest, SerialNumberAndPath) {
    FakeDeviceFixture fx;
    ASSERT_EQ(fx.device->GetSerialNumber(), "SERIAL123");
    ASSERT_EQ(fx.device->GetDevicePath(), "fake:DEVICE");
}

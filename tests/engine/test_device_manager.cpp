#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "offload/config/settings.hpp"
#include "offload/engine/device_manager.hpp"
#include "offload/engine/events.hpp"
#include "offload/engine/state_store.hpp"
#include "offload/system/block_device.hpp"
#include "offload/system/mount.hpp"

using namespace offload;
using namespace offload::engine;
using namespace std::chrono_literals;
namespace fs = std::filesystem;
using json = nlohmann::json;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;

class MockDeviceDetector : public system::DeviceDetector {
public:
    MOCK_METHOD(std::vector<system::Device>, detect, (), (override));
};

class MockMountBackend : public system::MountBackend {
public:
    MOCK_METHOD(system::MountResult, mount, (const system::MountRequest&),
                (override));
    MOCK_METHOD(void, unmount, (const fs::path&, bool), (override));
};

class RecordingSink : public EventSink {
public:
    void emit(std::string_view name, const json& payload) override {
        events.emplace_back(std::string(name), payload);
    }

    std::vector<std::pair<std::string, json>> events;
};

class DeviceLifecycleManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / "offload_device_test";
        fs::remove_all(root);
        paths.sourceMount = root / "usb";
        paths.destinationMount = root / "nas";
        fs::create_directories(paths.sourceMount / "DCIM");
        fs::create_directories(paths.destinationMount);
        std::ofstream(paths.sourceMount / "DCIM" / "A001.MP4") << "footage";

        options.interval = 10ms;
        options.settleDelay = 0ms;
        options.retryDelay = 0ms;
        options.mountRetries = 3;
        options.scan.minSize = 0;

        usb.path = "/dev/sdb1";
        usb.size = "58.6G";
        usb.model = "SanDisk";
        usb.fsType = "exfat";

        ON_CALL(backend, mount(_)).WillByDefault(Return(system::MountResult{}));
        EXPECT_CALL(backend, unmount(_, _)).Times(AnyNumber());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    auto makeManager() -> std::unique_ptr<DeviceLifecycleManager> {
        return std::make_unique<DeviceLifecycleManager>(
            store, sink, detector, backend, paths, options);
    }

    static auto mountFailure(const std::string& detail) -> system::MountResult {
        return type::fail(
            system::MountError{system::MountErrorKind::CommandFailed, detail});
    }

    auto eventNames() const -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto& event : sink.events) {
            names.push_back(event.first);
        }
        return names;
    }

    fs::path root;
    DevicePaths paths;
    PollOptions options;
    system::Device usb;
    StateStore store;
    RecordingSink sink;
    ::testing::NiceMock<MockDeviceDetector> detector;
    ::testing::NiceMock<MockMountBackend> backend;
};

TEST_F(DeviceLifecycleManagerTest, AttachMountsReadOnlyAndPublishesFiles) {
    EXPECT_CALL(backend,
                mount(::testing::AllOf(
                    Field(&system::MountRequest::source, "/dev/sdb1"),
                    Field(&system::MountRequest::readOnly, true))))
        .WillOnce(Return(system::MountResult{}));

    auto manager = makeManager();
    ASSERT_TRUE(manager->attachSource(usb));

    EXPECT_TRUE(store.isSourceMounted());
    ASSERT_EQ(store.files()->size(), 1U);
    EXPECT_EQ(store.files()->at(0).name, "DCIM/A001.MP4");

    ASSERT_EQ(sink.events.size(), 1U);
    EXPECT_EQ(sink.events[0].first, "device_connected");
    const json& payload = sink.events[0].second;
    EXPECT_EQ(payload["device"]["device"], "/dev/sdb1");
    EXPECT_EQ(payload["device"]["mountpoint"], paths.sourceMount.string());
    EXPECT_EQ(payload["files"].size(), 1U);
}

TEST_F(DeviceLifecycleManagerTest, MountRetriesUntilSuccess) {
    EXPECT_CALL(backend, mount(_))
        .WillOnce(Return(mountFailure("busy")))
        .WillOnce(Return(mountFailure("busy")))
        .WillOnce(Return(system::MountResult{}));

    auto manager = makeManager();
    auto result = manager->mountSource(usb, 3, 0ms);
    EXPECT_TRUE(result.isSuccess());
}

TEST_F(DeviceLifecycleManagerTest, AttachReportsErrorAfterAllRetries) {
    EXPECT_CALL(backend, mount(_))
        .Times(3)
        .WillRepeatedly(Return(mountFailure("wrong fs type")));

    auto manager = makeManager();
    EXPECT_FALSE(manager->attachSource(usb));
    EXPECT_FALSE(store.isSourceMounted());

    ASSERT_EQ(sink.events.size(), 1U);
    EXPECT_EQ(sink.events[0].first, "device_error");
    EXPECT_EQ(sink.events[0].second["device"], "/dev/sdb1");
    EXPECT_EQ(sink.events[0].second["error"], "wrong fs type");
}

TEST_F(DeviceLifecycleManagerTest, DetectContainsDetectorFailures) {
    EXPECT_CALL(detector, detect())
        .WillOnce(::testing::Throw(std::runtime_error("lsblk exploded")));
    auto manager = makeManager();
    EXPECT_TRUE(manager->detect().empty());
}

TEST_F(DeviceLifecycleManagerTest, PollAttachesNewDeviceAndDetachesOnRemoval) {
    EXPECT_CALL(detector, detect())
        .WillOnce(Return(std::vector<system::Device>{}))
        .WillOnce(Return(std::vector<system::Device>{usb}))
        .WillOnce(Return(std::vector<system::Device>{usb}))
        .WillOnce(Return(std::vector<system::Device>{usb}))
        .WillOnce(Return(std::vector<system::Device>{}));

    auto manager = makeManager();
    EXPECT_FALSE(manager->attachPresent());

    manager->pollOnce();  // appears, settles, attaches
    EXPECT_TRUE(store.isSourceMounted());

    manager->pollOnce();  // unchanged
    EXPECT_EQ(eventNames(), (std::vector<std::string>{"device_connected"}));

    EXPECT_CALL(backend, unmount(_, true));
    manager->pollOnce();  // removed
    EXPECT_FALSE(store.isSourceMounted());
    EXPECT_EQ(eventNames(), (std::vector<std::string>{"device_connected",
                                                      "device_disconnected"}));
}

TEST_F(DeviceLifecycleManagerTest, PollSkipsWhileTransferRuns) {
    store.setSource(usb, {{"DCIM/A001.MP4", 7, "7.0 B"}});
    store.setDestinationMounted(true);
    ASSERT_TRUE(store.tryBeginTransfer({"DCIM/A001.MP4"}, "d").isSuccess());

    EXPECT_CALL(detector, detect()).Times(0);
    auto manager = makeManager();
    manager->pollOnce();
    EXPECT_TRUE(store.isSourceMounted());
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(DeviceLifecycleManagerTest, PollYieldsToTransferStartedMidTick) {
    system::Device current = usb;
    current.path = "/dev/sdc1";
    store.setSource(current, {{"DCIM/A001.MP4", 7, "7.0 B"}});
    store.setDestinationMounted(true);

    EXPECT_CALL(detector, detect()).WillOnce(Invoke([this] {
        EXPECT_TRUE(
            store.tryBeginTransfer({"DCIM/A001.MP4"}, "d").isSuccess());
        return std::vector<system::Device>{usb};
    }));
    EXPECT_CALL(backend, mount(_)).Times(0);
    EXPECT_CALL(backend, unmount(_, _)).Times(0);

    auto manager = makeManager();
    manager->pollOnce();

    EXPECT_EQ(store.deviceState().device->path, "/dev/sdc1");
    EXPECT_TRUE(sink.events.empty());
    EXPECT_FALSE(store.isSourceReserved());
}

TEST_F(DeviceLifecycleManagerTest, AdmissionRefusedWhileAttachInFlight) {
    store.setDestinationMounted(true);
    std::string refusal;
    EXPECT_CALL(detector, detect())
        .WillOnce(Return(std::vector<system::Device>{usb}))
        .WillOnce(Invoke([this, &refusal] {
            auto begun = store.tryBeginTransfer({"DCIM/A001.MP4"}, "d");
            EXPECT_TRUE(begun.isError());
            if (begun.isError()) {
                refusal = begun.error();
            }
            return std::vector<system::Device>{usb};
        }));
    EXPECT_CALL(backend, mount(_)).Times(1);

    auto manager = makeManager();
    manager->pollOnce();

    EXPECT_EQ(refusal, "USB drive is being updated");
    EXPECT_TRUE(store.isSourceMounted());
    EXPECT_FALSE(store.isSourceReserved());
    EXPECT_TRUE(store.tryBeginTransfer({"DCIM/A001.MP4"}, "d").isSuccess());
}

TEST_F(DeviceLifecycleManagerTest, RescanRefusedDuringTransfer) {
    auto manager = makeManager();
    ASSERT_TRUE(manager->attachSource(usb));
    store.setDestinationMounted(true);
    ASSERT_TRUE(store.tryBeginTransfer({"DCIM/A001.MP4"}, "d").isSuccess());
    std::ofstream(paths.sourceMount / "DCIM" / "A002.MP4") << "more";

    EXPECT_FALSE(manager->rescanSource());
    EXPECT_EQ(store.files()->size(), 1U);
    EXPECT_EQ(eventNames(), (std::vector<std::string>{"device_connected"}));
}

TEST_F(DeviceLifecycleManagerTest, AttachPresentSeedsKnownDevices) {
    EXPECT_CALL(detector, detect())
        .WillRepeatedly(Return(std::vector<system::Device>{usb}));
    EXPECT_CALL(backend, mount(_)).Times(1);

    auto manager = makeManager();
    EXPECT_TRUE(manager->attachPresent());
    manager->pollOnce();
    EXPECT_EQ(eventNames(), (std::vector<std::string>{"device_connected"}));
}

TEST_F(DeviceLifecycleManagerTest, RescanMountedSourcePublishesFiles) {
    auto manager = makeManager();
    ASSERT_TRUE(manager->attachSource(usb));
    std::ofstream(paths.sourceMount / "DCIM" / "A002.MP4") << "more";

    manager->rescanSource();
    ASSERT_EQ(sink.events.size(), 2U);
    EXPECT_EQ(sink.events[1].first, "files_updated");
    EXPECT_EQ(sink.events[1].second["files"].size(), 2U);
}

TEST_F(DeviceLifecycleManagerTest, RescanWithoutDeviceReportsDisconnected) {
    EXPECT_CALL(detector, detect())
        .WillOnce(Return(std::vector<system::Device>{}));
    auto manager = makeManager();
    manager->rescanSource();
    EXPECT_EQ(eventNames(),
              (std::vector<std::string>{"device_disconnected"}));
}

TEST_F(DeviceLifecycleManagerTest, DestinationMountUsesCifsRequest) {
    config::Settings settings;
    settings.nasIp = "100.64.0.1";
    settings.shareName = "archive";
    EXPECT_CALL(backend,
                mount(::testing::AllOf(
                    Field(&system::MountRequest::source, "//100.64.0.1/archive"),
                    Field(&system::MountRequest::fsType, "cifs"))))
        .WillOnce(Return(system::MountResult{}))
        .WillOnce(Return(mountFailure("Permission denied")));

    auto manager = makeManager();
    EXPECT_TRUE(manager->mountDestination(settings).isSuccess());
    EXPECT_TRUE(store.isDestinationMounted());

    auto failed = manager->mountDestination(settings);
    ASSERT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().detail, "Permission denied");
    EXPECT_FALSE(store.isDestinationMounted());

    manager->unmountDestination();
    EXPECT_FALSE(store.isDestinationMounted());
}

TEST_F(DeviceLifecycleManagerTest, StartAndStopPolling) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->isPolling());
    manager->start();
    EXPECT_TRUE(manager->isPolling());
    std::this_thread::sleep_for(30ms);
    manager->stop();
    EXPECT_FALSE(manager->isPolling());
}

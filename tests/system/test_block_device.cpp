#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "offload/system/block_device.hpp"

using namespace offload::system;
namespace fs = std::filesystem;

TEST(ParseLsblkTest, UsbDiskContributesPartitions) {
    const char* text = R"({
      "blockdevices": [
        {"name": "sda", "size": "238.5G", "type": "disk", "mountpoint": null,
         "tran": "sata", "model": "Samsung SSD", "fstype": null, "rm": false,
         "children": [
           {"name": "sda1", "size": "238G", "type": "part",
            "mountpoint": "/", "tran": null, "model": null,
            "fstype": "ext4", "rm": false}
         ]},
        {"name": "sdb", "size": "58.6G", "type": "disk", "mountpoint": null,
         "tran": "usb", "model": "SanDisk Extreme ", "fstype": null,
         "rm": true,
         "children": [
           {"name": "sdb1", "size": "58.6G", "type": "part",
            "mountpoint": null, "tran": null, "model": null,
            "fstype": "exfat", "rm": true}
         ]}
      ]
    })";

    const auto devices = parseLsblkJson(text);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].path, "/dev/sdb1");
    EXPECT_EQ(devices[0].size, "58.6G");
    EXPECT_EQ(devices[0].model, "SanDisk Extreme");
    EXPECT_EQ(devices[0].fsType, "exfat");
    EXPECT_FALSE(devices[0].mountPoint.has_value());
}

TEST(ParseLsblkTest, DiskWithoutPartitionsIsItself) {
    const char* text = R"({"blockdevices": [
        {"name": "sdc", "size": "14.9G", "type": "disk", "mountpoint": null,
         "tran": "usb", "model": null, "fstype": "vfat", "rm": "1"}
    ]})";
    const auto devices = parseLsblkJson(text);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].path, "/dev/sdc");
    EXPECT_EQ(devices[0].model, "USB Drive");
    EXPECT_EQ(devices[0].fsType, "vfat");
}

TEST(ParseLsblkTest, BridgeAdapterNeedsModelAndRemovable) {
    const char* text = R"({"blockdevices": [
        {"name": "sdd", "size": "1.8T", "type": "disk", "tran": null,
         "model": "Card Reader", "rm": "1",
         "children": [{"name": "sdd1", "size": "1.8T", "type": "part",
                       "fstype": "exfat"}]},
        {"name": "sde", "size": "1.8T", "type": "disk", "tran": null,
         "model": "Internal", "rm": "0"},
        {"name": "sdf", "size": "1.8T", "type": "disk", "tran": null,
         "model": null, "rm": 1}
    ]})";
    const auto devices = parseLsblkJson(text);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].path, "/dev/sdd1");
    EXPECT_EQ(devices[0].model, "Card Reader");
}

TEST(ParseLsblkTest, SkipsNonPartitionChildrenAndDefaultsSize) {
    const char* text = R"({"blockdevices": [
        {"name": "sdg", "type": "disk", "tran": "USB", "model": "Stick",
         "children": [
           {"name": "sdg1", "type": "part", "mountpoint": "/media/stick"},
           {"name": "luks-1", "type": "crypt", "size": "10G"}
         ]}
    ]})";
    const auto devices = parseLsblkJson(text);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].size, "?");
    ASSERT_TRUE(devices[0].mountPoint.has_value());
    EXPECT_EQ(*devices[0].mountPoint, "/media/stick");
}

TEST(ParseLsblkTest, EmptyAndMalformed) {
    EXPECT_TRUE(parseLsblkJson(R"({"blockdevices": []})").empty());
    EXPECT_TRUE(parseLsblkJson(R"({})").empty());
    EXPECT_THROW(static_cast<void>(parseLsblkJson("{ broken")),
                 nlohmann::json::exception);
}

TEST(DeviceTest, JsonAndToString) {
    Device device{"/dev/sdb1", "58.6G", "SanDisk", "exfat", std::nullopt};
    const nlohmann::json j = device;
    EXPECT_EQ(j["device"], "/dev/sdb1");
    EXPECT_EQ(j["fstype"], "exfat");
    EXPECT_TRUE(j["mountpoint"].is_null());
    EXPECT_EQ(device.toString(), "/dev/sdb1 (SanDisk, 58.6G, exfat)");

    device.mountPoint = "/mnt/offloader/usb";
    EXPECT_EQ(nlohmann::json(device)["mountpoint"], "/mnt/offloader/usb");
}

class ByIdDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / "offload_byid_test";
        fs::remove_all(root);
        byId = root / "by-id";
        dev = root / "dev";
        fs::create_directories(byId);
        fs::create_directories(dev);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void node(const std::string& name) { std::ofstream(dev / name) << "x"; }

    void link(const std::string& name, const std::string& target) {
        fs::create_symlink(dev / target, byId / name);
    }

    fs::path root;
    fs::path byId;
    fs::path dev;
};

TEST_F(ByIdDirectoryTest, PrefersPartitionsOverWholeDisk) {
    node("sdb");
    node("sdb1");
    node("sdc");
    link("usb-SanDisk_Extreme_1234-0:0", "sdb");
    link("usb-SanDisk_Extreme_1234-0:0-part1", "sdb1");
    link("usb-Generic_Reader_99-0:0", "sdc");
    link("ata-Internal_Disk", "sdb");

    std::map<std::string, DeviceProperties> props{
        {fs::canonical(dev / "sdb1").string(),
         {"exfat", "SanDisk Extreme", "58.6 GB"}}};
    auto lookup = [&](const std::string& path)
        -> std::optional<DeviceProperties> {
        if (auto it = props.find(path); it != props.end()) {
            return it->second;
        }
        return std::nullopt;
    };

    const auto devices = scanByIdDirectory(byId, lookup);
    ASSERT_EQ(devices.size(), 2U);

    // Sorted by link name: Generic before SanDisk.
    EXPECT_EQ(devices[0].path, fs::canonical(dev / "sdc").string());
    EXPECT_EQ(devices[0].model, "USB Drive");
    EXPECT_EQ(devices[0].size, "?");

    EXPECT_EQ(devices[1].path, fs::canonical(dev / "sdb1").string());
    EXPECT_EQ(devices[1].model, "SanDisk Extreme");
    EXPECT_EQ(devices[1].size, "58.6 GB");
    EXPECT_EQ(devices[1].fsType, "exfat");
}

TEST_F(ByIdDirectoryTest, DuplicatesAndDanglingLinksSkipped) {
    node("sdd1");
    link("usb-A-0:0-part1", "sdd1");
    link("usb-B-0:0-part1", "sdd1");
    link("usb-C-0:0-part1", "missing");

    const auto devices = scanByIdDirectory(byId, nullptr);
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].path, fs::canonical(dev / "sdd1").string());
}

TEST_F(ByIdDirectoryTest, MissingDirectoryIsEmpty) {
    EXPECT_TRUE(scanByIdDirectory(root / "nope", nullptr).empty());
}

TEST(DeviceDetectorTest, CreateNeverThrowsOnDetect) {
    auto detector = DeviceDetector::create();
    ASSERT_NE(detector, nullptr);
    EXPECT_NO_THROW(static_cast<void>(detector->detect()));
}

/**
 * @file DeviceScanSnapshotSourceTest.cpp
 * @brief Unit tests for the per-device snapshot source
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "services/DeviceScanSnapshotSource.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

constexpr auto SAMPLE_DEVICE_REPORT = R"(Hard Disk Sentinel for LINUX console 0.20-x64
(C) 2023 info@hdsentinel.com

Start with -r [reportfile] to save data to report, -h for help

Examining hard disk configuration ...

HDD Device  0: /dev/sda
HDD Model ID  : SAMSUNG HD103UJ
HDD Serial No : S13PJ90S113060
HDD Revision  : 1AA01113
HDD Size      : 953869 MB
Interface     : S-ATA Gen2, 3 Gbps
Temperature   : 38 °C
Highest Temp. : 51 °C
Health        : 100 %
Performance   : 100 %
Power on time : 2345 days, 6 hours
Est. lifetime : more than 1000 days
Total written : 12.34 TB
  The status of the hard disk is PERFECT. Problematic or weak sectors were not found.
    No actions needed.
)";

}  // namespace

class DeviceScanSnapshotSourceTest : public LogCaptureFixture {
protected:
    std::filesystem::path sys_block;

    void SetUp() override {
        LogCaptureFixture::SetUp();
        sys_block = std::filesystem::temp_directory_path() /
                    std::format("hdsentinel-mqtt-sysblock-{}", getpid());
        std::filesystem::create_directories(sys_block);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(sys_block, ec);
        LogCaptureFixture::TearDown();
    }

    void AddDevice(const std::string& name, const std::string& sectors) {
        std::filesystem::create_directories(sys_block / name);
        std::ofstream{sys_block / name / "size"} << sectors << "\n";
    }
};

TEST_F(DeviceScanSnapshotSourceTest, ParseDeviceReport_MapsLabelsToReportNames) {
    const auto attributes =
        DeviceScanSnapshotSource::parse_device_report(SAMPLE_DEVICE_REPORT, "/dev/sda");

    EXPECT_EQ(attributes.at("Hard_Disk_Device"), "/dev/sda");
    EXPECT_EQ(attributes.at("Hard_Disk_Model_ID"), "SAMSUNG HD103UJ");
    EXPECT_EQ(attributes.at("Hard_Disk_Serial_Number"), "S13PJ90S113060");
    EXPECT_EQ(attributes.at("Firmware_Revision"), "1AA01113");
    EXPECT_EQ(attributes.at("Total_Size"), "953869 MB");
    EXPECT_EQ(attributes.at("Interface"), "S-ATA Gen2, 3 Gbps");
    EXPECT_EQ(attributes.at("Current_Temperature"), "38 °C");
    EXPECT_EQ(attributes.at("Maximum_temperature_during_entire_lifespan"), "51 °C");
    EXPECT_EQ(attributes.at("Health"), "100 %");
    EXPECT_EQ(attributes.at("Performance"), "100 %");
    EXPECT_EQ(attributes.at("Power_on_time"), "2345 days, 6 hours");
    EXPECT_EQ(attributes.at("Estimated_remaining_lifetime"), "more than 1000 days");
    EXPECT_EQ(attributes.at("Lifetime_Writes"), "12.34 TB");
    EXPECT_EQ(attributes.at("Description"),
              "The status of the hard disk is PERFECT. Problematic or weak sectors were not found.");
    EXPECT_EQ(attributes.at("Tip"), "No actions needed");
}

TEST_F(DeviceScanSnapshotSourceTest, ParseDeviceReport_HandlesCrLfAndMissingFields) {
    const auto attributes = DeviceScanSnapshotSource::parse_device_report(
        "HDD Model ID  : WDC WD10EZEX\r\nHDD Serial No : WD-123\r\n", "/dev/sdb");

    EXPECT_EQ(attributes.at("Hard_Disk_Model_ID"), "WDC WD10EZEX");
    EXPECT_EQ(attributes.at("Hard_Disk_Serial_Number"), "WD-123");
    EXPECT_FALSE(attributes.contains("Health"));
    EXPECT_FALSE(attributes.contains("Description"));
}

TEST_F(DeviceScanSnapshotSourceTest, ListBlockDevices_SkipsVirtualAndEmptyDevices) {
    AddDevice("sda", "1953525168");
    AddDevice("nvme0n1", "2000409264");
    AddDevice("loop0", "1024");
    AddDevice("ram0", "8192");
    AddDevice("dm-0", "4096");
    AddDevice("sr0", "0");

    auto devices = DeviceScanSnapshotSource::list_block_devices(sys_block);

    ASSERT_TRUE(devices.has_value()) << devices.error().message;
    EXPECT_THAT(*devices, testing::ElementsAre("/dev/nvme0n1", "/dev/sda"));
}

TEST_F(DeviceScanSnapshotSourceTest, ListBlockDevices_MissingDirectoryIsSnapshotError) {
    auto devices = DeviceScanSnapshotSource::list_block_devices(sys_block / "missing");

    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().kind, util::ErrorKind::SNAPSHOT);
}

// Test: a device whose query fails is dropped, the snapshot still succeeds
TEST_F(DeviceScanSnapshotSourceTest, TakeSnapshot_DropsDevicesThatFail) {
    AddDevice("sda", "1953525168");
    DeviceScanSnapshotSource source{DeviceScanOptions{.hdsentinel_binary = "/nonexistent/hdsentinel",
                                                      .sys_block_dir = sys_block,
                                                      .timeout = std::chrono::seconds{5}}};

    auto snapshot = source.take_snapshot();

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_TRUE(snapshot->empty());
    EXPECT_THAT(info_output.str(), testing::HasSubstr("Failed to query /dev/sda"));
}

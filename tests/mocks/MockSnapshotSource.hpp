/**
 * @file MockSnapshotSource.hpp
 * @brief Google Mock implementation of ISnapshotSource
 */

#pragma once

#include "services/ISnapshotSource.hpp"

#include <gmock/gmock.h>

#include <format>
#include <memory>
#include <string>

class MockSnapshotSource : public ISnapshotSource {
public:
    MOCK_METHOD((std::expected<DiskSnapshot, util::Error>), take_snapshot, (), (override));

    // Helper: Create a nice mock returning an empty snapshot
    static std::shared_ptr<MockSnapshotSource> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockSnapshotSource>>();

        ON_CALL(*mock, take_snapshot())
            .WillByDefault(testing::Return(std::expected<DiskSnapshot, util::Error>{}));

        return mock;
    }

    // Helper: Create attributes of one disk as the XML report would list them
    static DiskAttributes CreateTestDisk(const std::string& model, const std::string& serial,
                                         const std::string& health = "100") {
        return DiskAttributes{
            {"Hard_Disk_Number", "0"},
            {"Hard_Disk_Device", "/dev/sda"},
            {"Hard_Disk_Model_ID", model},
            {"Hard_Disk_Serial_Number", serial},
            {"Firmware_Revision", "1AA01113"},
            {"Current_Temperature", "38 °C"},
            {"Health", std::format("{} %", health)},
            {"Power_on_time", "2345 days, 6 hours"},
            {"Description", "The status of the hard disk is PERFECT."},
        };
    }
};

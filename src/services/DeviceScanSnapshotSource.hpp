/**
 * @file DeviceScanSnapshotSource.hpp
 * @brief Snapshot source that queries every block device separately
 */

#pragma once

#include "services/ISnapshotSource.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * @struct DeviceScanOptions
 * @brief Device discovery and per-device process settings
 */
struct DeviceScanOptions {
    std::filesystem::path hdsentinel_binary = "/usr/sbin/hdsentinel";
    std::filesystem::path sys_block_dir = "/sys/block";
    std::chrono::milliseconds timeout{std::chrono::minutes{2}};  ///< Per device
};

/**
 * @class DeviceScanSnapshotSource
 * @brief Runs `hdsentinel -dev /dev/<name>` for each physical disk in parallel
 *
 * The text report of each device is scraped into the same attribute names the
 * XML report uses, so both sources feed the same sensor templates.
 */
class DeviceScanSnapshotSource : public ISnapshotSource {
public:
    explicit DeviceScanSnapshotSource(DeviceScanOptions options);
    ~DeviceScanSnapshotSource() override = default;

    [[nodiscard]] auto take_snapshot() -> std::expected<DiskSnapshot, util::Error> override;

    /**
     * @brief Physical block devices below @p sys_block_dir
     * @return Device paths such as "/dev/sda", sorted; loop, ram and dm devices
     *         and devices reporting zero size are left out
     */
    [[nodiscard]] static auto list_block_devices(const std::filesystem::path& sys_block_dir)
        -> std::expected<std::vector<std::string>, util::Error>;

    /**
     * @brief Scrape the text report printed by `hdsentinel -dev`
     * @param report Complete stdout of the utility
     * @param device_path Stored as Hard_Disk_Device
     */
    [[nodiscard]] static auto parse_device_report(std::string_view report,
                                                  const std::string& device_path)
        -> DiskAttributes;

private:
    [[nodiscard]] auto query_device(const std::string& device_path) const
        -> std::expected<DiskAttributes, util::Error>;

    DeviceScanOptions options_;
};

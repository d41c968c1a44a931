/**
 * @file XmlReportSnapshotSource.hpp
 * @brief Snapshot source backed by the Hard Disk Sentinel XML report
 */

#pragma once

#include "services/ISnapshotSource.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

/**
 * @struct XmlReportOptions
 * @brief Where the report comes from
 */
struct XmlReportOptions {
    std::filesystem::path hdsentinel_binary = "/usr/sbin/hdsentinel";
    std::optional<std::filesystem::path> report_path;  ///< Existing report; hdsentinel is not run
    std::filesystem::path generated_report_path;       ///< Where `hdsentinel -r` writes its report
    std::chrono::milliseconds timeout{std::chrono::minutes{2}};
};

/**
 * @class XmlReportSnapshotSource
 * @brief Runs `hdsentinel -solid -xml -r <file>` and parses every Hard_Disk_Summary
 *
 * Each direct child element of a Hard_Disk_Summary becomes one attribute.
 * Disks without a Hard_Disk_Serial_Number are skipped with a warning.
 */
class XmlReportSnapshotSource : public ISnapshotSource {
public:
    explicit XmlReportSnapshotSource(XmlReportOptions options);
    ~XmlReportSnapshotSource() override = default;

    [[nodiscard]] auto take_snapshot() -> std::expected<DiskSnapshot, util::Error> override;

    /**
     * @brief Parse a complete XML report
     * @param xml Report text; ISO-8859-1 input is converted to UTF-8 first
     */
    [[nodiscard]] static auto parse_report(std::string_view xml)
        -> std::expected<DiskSnapshot, util::Error>;

private:
    [[nodiscard]] auto generate_report() -> std::expected<std::filesystem::path, util::Error>;

    XmlReportOptions options_;
};

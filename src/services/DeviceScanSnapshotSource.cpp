#include "services/DeviceScanSnapshotSource.hpp"

#include "util/Logger.hpp"
#include "util/ProcessRunner.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <future>
#include <ranges>
#include <regex>
#include <utility>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace {

constexpr auto COMPONENT = "DeviceScanSource";

// Virtual device patterns to skip
constexpr std::array VIRTUAL_PATTERNS{"loop", "ram", "dm-"};

auto is_virtual_device(std::string_view name) noexcept -> bool {
    return rng::any_of(VIRTUAL_PATTERNS,
                       [name](const char* pattern) { return name.contains(pattern); });
}

auto read_sector_count(const fs::path& device_dir) -> uint64_t {
    std::ifstream size_file{device_dir / "size"};
    uint64_t sectors = 0;
    if (!(size_file >> sectors)) {
        return 0;
    }
    return sectors;
}

struct ReportField {
    const char* attribute;
    std::regex pattern;
};

// Labels printed by `hdsentinel -dev`, mapped to the XML report element names
auto report_fields() -> const std::vector<ReportField>& {
    static const std::vector<ReportField> fields = [] {
        auto labelled = [](const char* label) {
            return std::regex{std::format(R"({}\s*:\s*(.*))", label)};
        };
        return std::vector<ReportField>{
            {"Hard_Disk_Model_ID", labelled(R"(HDD Model ID)")},
            {"Hard_Disk_Serial_Number", labelled(R"(HDD Serial No)")},
            {"Firmware_Revision", labelled(R"(HDD Revision)")},
            {"Total_Size", labelled(R"(HDD Size)")},
            {"Interface", labelled(R"(Interface)")},
            {"Current_Temperature", labelled(R"(Temperature)")},
            {"Maximum_temperature_during_entire_lifespan", labelled(R"(Highest Temp\.)")},
            {"Health", labelled(R"(Health)")},
            {"Performance", labelled(R"(Performance)")},
            {"Power_on_time", labelled(R"(Power on time)")},
            {"Estimated_remaining_lifetime", labelled(R"(Est\. lifetime)")},
            {"Lifetime_Writes", labelled(R"(Total written)")},
            {"Description", std::regex{R"(.*  (The.*))"}},
            {"Tip", std::regex{R"(\.*    (.*)\.$)"}},
        };
    }();
    return fields;
}

auto trim(std::string_view text) -> std::string {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return std::string{text.substr(first, last - first + 1)};
}

}  // namespace

DeviceScanSnapshotSource::DeviceScanSnapshotSource(DeviceScanOptions options)
    : options_(std::move(options)) {}

auto DeviceScanSnapshotSource::list_block_devices(const fs::path& sys_block_dir)
    -> std::expected<std::vector<std::string>, util::Error> {
    std::error_code ec;
    if (!fs::is_directory(sys_block_dir, ec)) {
        return std::unexpected(util::Error{util::ErrorKind::SNAPSHOT,
                                           std::format("{} is not a directory",
                                                       sys_block_dir.string())});
    }

    std::vector<std::string> devices;
    for (const auto& entry : fs::directory_iterator{sys_block_dir, ec}) {
        const auto device_name = entry.path().filename().string();

        if (is_virtual_device(device_name)) {
            continue;
        }
        if (read_sector_count(entry.path()) == 0) {
            continue;
        }
        devices.push_back(std::format("/dev/{}", device_name));
    }
    if (ec) {
        return std::unexpected(util::Error{util::ErrorKind::SNAPSHOT,
                                           std::format("Failed to list {}: {}",
                                                       sys_block_dir.string(), ec.message()),
                                           ec.value()});
    }

    rng::sort(devices);
    return devices;
}

auto DeviceScanSnapshotSource::parse_device_report(std::string_view report,
                                                   const std::string& device_path)
    -> DiskAttributes {
    DiskAttributes attributes;
    attributes["Hard_Disk_Device"] = device_path;

    const auto& fields = report_fields();
    for (auto line_range : report | std::views::split('\n')) {
        std::string line{line_range.begin(), line_range.end()};
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        for (const auto& field : fields) {
            if (attributes.contains(field.attribute)) {
                continue;
            }
            std::smatch match;
            if (std::regex_search(line, match, field.pattern)) {
                attributes[field.attribute] = trim(match.str(1));
            }
        }
    }

    return attributes;
}

auto DeviceScanSnapshotSource::query_device(const std::string& device_path) const
    -> std::expected<DiskAttributes, util::Error> {
    auto output =
        util::run_process({options_.hdsentinel_binary.string(), "-dev", device_path},
                          options_.timeout);
    if (!output) {
        return std::unexpected(output.error());
    }
    if (output->exit_code != 0) {
        return std::unexpected(util::Error{
            util::ErrorKind::SNAPSHOT,
            std::format("hdsentinel exited with status {} for {}", output->exit_code,
                        device_path)});
    }
    LOG_DEBUG(COMPONENT, output->stdout_text);
    return parse_device_report(output->stdout_text, device_path);
}

auto DeviceScanSnapshotSource::take_snapshot() -> std::expected<DiskSnapshot, util::Error> {
    auto devices = list_block_devices(options_.sys_block_dir);
    if (!devices) {
        return std::unexpected(devices.error());
    }

    LOG_INFO(COMPONENT, std::format("Querying {} block devices with hdsentinel...",
                                    devices->size()));

    // Workers only return values; this thread owns the snapshot
    using DeviceResult = std::pair<std::string, std::expected<DiskAttributes, util::Error>>;
    std::vector<std::future<DeviceResult>> futures;
    futures.reserve(devices->size());
    for (const auto& path : *devices) {
        futures.push_back(std::async(std::launch::async, [this, path]() {
            return DeviceResult{path, query_device(path)};
        }));
    }

    DiskSnapshot snapshot;
    for (auto& future : futures) {
        try {
            auto [path, attributes] = future.get();
            if (!attributes) {
                LOG_WARNING(COMPONENT, std::format("Failed to query {}: {}", path,
                                                   attributes.error().message));
                continue;
            }

            auto serial = attributes->find(disk_attr::SERIAL_NUMBER);
            if (serial == attributes->end() || serial->second.empty()) {
                LOG_WARNING(COMPONENT,
                            std::format("Found disk without serial number at {}, skipping", path));
                continue;
            }
            const auto serial_number = serial->second;
            snapshot[serial_number] = std::move(*attributes);
        } catch (const std::exception& e) {
            LOG_ERROR(COMPONENT, std::format("Device query failed: {}", e.what()));
        }
    }

    return snapshot;
}

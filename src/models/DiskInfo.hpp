/**
 * @file DiskInfo.hpp
 * @brief Data model for disk telemetry snapshots and disk identity
 */

#pragma once

#include <map>
#include <string>

/// Raw attribute name (free-form casing) -> raw attribute value
using DiskAttributes = std::map<std::string, std::string>;

/// Disk serial number -> that disk's attributes, as returned by one poll
using DiskSnapshot = std::map<std::string, DiskAttributes>;

/// Attribute names used to identify a disk inside a snapshot
namespace disk_attr {
inline constexpr auto MODEL_ID = "Hard_Disk_Model_ID";
inline constexpr auto SERIAL_NUMBER = "Hard_Disk_Serial_Number";
inline constexpr auto FIRMWARE_REVISION = "Firmware_Revision";
}  // namespace disk_attr

/**
 * @struct DiskIdentity
 * @brief Immutable identity of a physical disk, fixed when first observed
 */
struct DiskIdentity {
    std::string serial_number;      ///< Primary key, never empty in a well-formed snapshot
    std::string model_id;           ///< Model string as reported, may be empty
    std::string firmware_revision;  ///< Firmware string as reported, may be empty

    auto operator==(const DiskIdentity&) const -> bool = default;

    /**
     * @brief Build the identity of @p serial from its snapshot attributes
     */
    [[nodiscard]] static auto from_attributes(const std::string& serial,
                                              const DiskAttributes& attributes) -> DiskIdentity {
        DiskIdentity identity{.serial_number = serial, .model_id = {}, .firmware_revision = {}};
        if (auto it = attributes.find(disk_attr::MODEL_ID); it != attributes.end()) {
            identity.model_id = it->second;
        }
        if (auto it = attributes.find(disk_attr::FIRMWARE_REVISION); it != attributes.end()) {
            identity.firmware_revision = it->second;
        }
        return identity;
    }
};

/**
 * @file ISnapshotSource.hpp
 * @brief Interface for collecting one round of disk telemetry
 */

#pragma once

#include "models/DiskInfo.hpp"
#include "util/Error.hpp"

#include <expected>

/**
 * @class ISnapshotSource
 * @brief Abstract source of disk health snapshots
 *
 * Implementations must be safe to call repeatedly. A transient failure of
 * the diagnostic utility is reported as an error; the caller decides
 * whether that is fatal.
 */
class ISnapshotSource {
public:
    virtual ~ISnapshotSource() = default;

    /**
     * @brief Poll the diagnostic source once
     * @return Serial number -> raw attributes of every disk seen
     */
    [[nodiscard]] virtual auto take_snapshot() -> std::expected<DiskSnapshot, util::Error> = 0;
};

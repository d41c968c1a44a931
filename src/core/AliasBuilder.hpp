/**
 * @file AliasBuilder.hpp
 * @brief Stable, human-readable disk aliases
 *
 * The alias is a pure function of model and serial number:
 * snake_case(model) + "_" + safe_id(serial). Two disks of the same model
 * therefore get distinct aliases, and a disk keeps its alias across
 * restarts. The alias ends up in every topic and entity name of the disk.
 */

#pragma once

#include <string>
#include <string_view>

namespace core {

/**
 * @brief Convert a model string to snake_case
 *
 * A boundary is inserted before every run of uppercase letters and before
 * every uppercase-then-lowercase run; hyphens count as whitespace.
 * "WDC WD10EZEX-00WN4A0" -> "wdc_wd10_ezex_00_wn4_a0".
 */
[[nodiscard]] auto to_snake_case(std::string_view name) -> std::string;

/**
 * @brief Collapse every run of non-alphanumeric characters to '_', trim '_', lowercase
 *
 * "WD-WCC6Y5ABCDEF" -> "wd_wcc6y5abcdef".
 */
[[nodiscard]] auto to_safe_id(std::string_view value) -> std::string;

/**
 * @brief Alias of a disk; empty model or serial is replaced by "unknown"
 *
 * A serial made only of punctuation also yields the "unknown" suffix.
 */
[[nodiscard]] auto build_disk_alias(std::string_view model_id, std::string_view serial_number)
    -> std::string;

}  // namespace core

/**
 * @file TemplateStore.hpp
 * @brief Loading of the declarative sensor template configuration
 *
 * The store is a JSON document keyed by sensor kind, then template name:
 *
 * @code
 * {
 *   "sensor": {
 *     "health": { "_key": "health", "_type": "float", "unit_of_measurement": "%" },
 *     "tip": null
 *   }
 * }
 * @endcode
 *
 * Keys starting with '_' are internal override fields (`_key`, `_type`,
 * matched case-insensitively after stripping the underscores); every other
 * key is copied verbatim into the discovery payload.
 */

#pragma once

#include "models/SensorTypes.hpp"
#include "util/Error.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace config {

/**
 * @brief Build templates from an already parsed document
 * @return Templates ordered by kind, then name; or a configuration error
 */
[[nodiscard]] auto sensor_templates_from_json(const nlohmann::json& document)
    -> std::expected<std::vector<SensorTemplate>, util::Error>;

[[nodiscard]] auto parse_sensor_templates(std::string_view json_text)
    -> std::expected<std::vector<SensorTemplate>, util::Error>;

[[nodiscard]] auto load_sensor_templates(const std::filesystem::path& path)
    -> std::expected<std::vector<SensorTemplate>, util::Error>;

}  // namespace config

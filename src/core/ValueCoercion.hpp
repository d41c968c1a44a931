/**
 * @file ValueCoercion.hpp
 * @brief Conversion of raw attribute text into typed state values
 *
 * Numeric coercion takes the first run of decimal digits anywhere in the
 * text ("38 C" -> 38, "More than 1000 days" -> 1000). Text without any
 * digit becomes 0, so "no number" and "zero" are indistinguishable in the
 * published state. Coercion never fails.
 */

#pragma once

#include "models/SensorTypes.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace core {

using CoercedValue = std::variant<std::int64_t, double, std::string>;

/**
 * @brief First maximal run of ASCII digits in @p raw, or "0" if there is none
 */
[[nodiscard]] auto extract_first_number(std::string_view raw) -> std::string_view;

/**
 * @brief Coerce @p raw according to the declared @p type
 *
 * An integer digit run too long for int64 saturates to INT64_MAX.
 */
[[nodiscard]] auto coerce_value(std::string_view raw, ValueType type) -> CoercedValue;

[[nodiscard]] auto to_json(const CoercedValue& value) -> nlohmann::json;

}  // namespace core

#include "core/ValueCoercion.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace core {

namespace {

constexpr auto is_ascii_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

auto parse_int(std::string_view digits) -> std::int64_t {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return value;
}

auto parse_float(std::string_view digits) -> double {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<double>::infinity();
    }
    return value;
}

}  // namespace

auto extract_first_number(std::string_view raw) -> std::string_view {
    const auto begin = std::ranges::find_if(raw, is_ascii_digit);
    if (begin == raw.end()) {
        return "0";
    }
    const auto end = std::find_if_not(begin, raw.end(), is_ascii_digit);
    return std::string_view{begin, end};
}

auto coerce_value(std::string_view raw, ValueType type) -> CoercedValue {
    switch (type) {
        case ValueType::INT:
            return parse_int(extract_first_number(raw));
        case ValueType::FLOAT:
            return parse_float(extract_first_number(raw));
        case ValueType::STR:
            break;
    }
    return std::string{raw};
}

auto to_json(const CoercedValue& value) -> nlohmann::json {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

}  // namespace core

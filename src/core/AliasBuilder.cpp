#include "core/AliasBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace core {

namespace {

constexpr auto UNKNOWN = "unknown";

auto ascii_lower(std::string value) -> std::string {
    std::ranges::transform(value, value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

auto to_snake_case(std::string_view name) -> std::string {
    static const std::regex uppercase_run{"([A-Z]+)"};
    static const std::regex capitalized_word{"([A-Z][a-z]+)"};

    std::string spaced{name};
    std::ranges::replace(spaced, '-', ' ');
    spaced = std::regex_replace(spaced, uppercase_run, " $1");
    spaced = std::regex_replace(spaced, capitalized_word, " $1");

    std::istringstream words{spaced};
    std::string result;
    for (std::string word; words >> word;) {
        if (!result.empty()) {
            result += '_';
        }
        result += word;
    }
    return ascii_lower(std::move(result));
}

auto to_safe_id(std::string_view value) -> std::string {
    static const std::regex non_alphanumeric{"[^a-zA-Z0-9]+"};

    auto collapsed = std::regex_replace(std::string{value}, non_alphanumeric, "_");

    const auto first = collapsed.find_first_not_of('_');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = collapsed.find_last_not_of('_');
    return ascii_lower(collapsed.substr(first, last - first + 1));
}

auto build_disk_alias(std::string_view model_id, std::string_view serial_number) -> std::string {
    const auto model_part = to_snake_case(model_id.empty() ? UNKNOWN : model_id);
    auto serial_part = to_safe_id(serial_number);
    if (serial_part.empty()) {
        serial_part = UNKNOWN;
    }
    return model_part + "_" + serial_part;
}

}  // namespace core

#include "config/TemplateStore.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>

namespace config {

namespace {

constexpr auto COMPONENT = "TemplateStore";

const nlohmann::json EMPTY_TEMPLATE = nlohmann::json::object();

auto config_error(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::CONFIGURATION, std::move(message)});
}

// "_Type" / "__key" -> "type" / "key"
auto internal_field_name(std::string_view key) -> std::string {
    key.remove_prefix(std::min(key.find_first_not_of('_'), key.size()));
    std::string name{key};
    std::ranges::transform(name, name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

// Query keys become a topic level and a template variable
auto is_valid_query_key(std::string_view key) -> bool {
    return !key.empty() && std::ranges::all_of(key, [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

auto parse_template(SensorKind kind, const std::string& name, const nlohmann::json& body)
    -> std::expected<SensorTemplate, util::Error> {
    SensorTemplate sensor{.kind = kind,
                          .name = name,
                          .query_key = name,
                          .value_type = ValueType::STR,
                          .extra_payload = nlohmann::json::object()};

    if (!body.is_null() && !body.is_object()) {
        return config_error(std::format("{}.{}: template must be an object", to_string(kind), name));
    }

    const auto& fields = body.is_null() ? EMPTY_TEMPLATE : body;
    for (const auto& [key, value] : fields.items()) {
        if (!key.starts_with('_')) {
            sensor.extra_payload[key] = value;
            continue;
        }

        const auto field = internal_field_name(key);
        if (field == "key") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                return config_error(
                    std::format("{}.{}: {} must be a non-empty string", to_string(kind), name, key));
            }
            sensor.query_key = value.get<std::string>();
        } else if (field == "type") {
            const auto type = value.is_string() ? parse_value_type(value.get<std::string>())
                                                : std::nullopt;
            if (!type) {
                return config_error(std::format("{}.{}: {} must be one of int, float, str",
                                                to_string(kind), name, key));
            }
            sensor.value_type = *type;
        } else {
            return config_error(
                std::format("{}.{}: unknown internal field {}", to_string(kind), name, key));
        }
    }

    if (!is_valid_query_key(sensor.query_key)) {
        return config_error(
            std::format("{}.{}: query key '{}' may only contain letters, digits, '_' and '-'",
                        to_string(kind), name, sensor.query_key));
    }
    return sensor;
}

}  // namespace

auto sensor_templates_from_json(const nlohmann::json& document)
    -> std::expected<std::vector<SensorTemplate>, util::Error> {
    if (!document.is_object()) {
        return config_error("Sensor template document must be an object keyed by sensor kind");
    }

    for (const auto& [key, value] : document.items()) {
        const bool known = std::ranges::any_of(
            SENSOR_KINDS, [&key](SensorKind kind) { return to_string(kind) == key; });
        if (!known) {
            LOG_WARNING(COMPONENT, std::format("Ignoring unsupported sensor kind '{}'", key));
        }
    }

    std::vector<SensorTemplate> templates;
    for (const auto kind : SENSOR_KINDS) {
        const auto section = document.find(std::string{to_string(kind)});
        if (section == document.end() || section->is_null()) {
            continue;
        }
        if (!section->is_object()) {
            return config_error(std::format("Section '{}' must be an object", to_string(kind)));
        }

        // json objects iterate in key order, so templates come out sorted by name
        for (const auto& [name, body] : section->items()) {
            auto sensor = parse_template(kind, name, body);
            if (!sensor) {
                return std::unexpected(sensor.error());
            }
            templates.push_back(std::move(*sensor));
        }

        LOG_DEBUG(COMPONENT, std::format("Loaded {} {} templates",
                                         section->size(), to_string(kind)));
    }

    return templates;
}

auto parse_sensor_templates(std::string_view json_text)
    -> std::expected<std::vector<SensorTemplate>, util::Error> {
    auto document = nlohmann::json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Sensor template document is not valid JSON");
    }
    return sensor_templates_from_json(document);
}

auto load_sensor_templates(const std::filesystem::path& path)
    -> std::expected<std::vector<SensorTemplate>, util::Error> {
    std::ifstream file{path};
    if (!file.is_open()) {
        return config_error(std::format("Cannot open sensor template file {}", path.string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto templates = parse_sensor_templates(contents.str());
    if (!templates) {
        return config_error(std::format("{}: {}", path.string(), templates.error().message));
    }
    return templates;
}

}  // namespace config

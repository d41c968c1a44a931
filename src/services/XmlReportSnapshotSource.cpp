/**
 * @file XmlReportSnapshotSource.cpp
 * @brief XML report snapshot source implementation (GMarkup based)
 */

#include "services/XmlReportSnapshotSource.hpp"

#include "util/Logger.hpp"
#include "util/ProcessRunner.hpp"

#include <glib.h>

#include <algorithm>
#include <format>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr auto COMPONENT = "XmlReportSource";
constexpr std::string_view SUMMARY_ELEMENT = "Hard_Disk_Summary";

auto snapshot_error(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::SNAPSHOT, std::move(message)});
}

/**
 * Values may be wrapped over several lines in the report; line breaks are
 * dropped and the surrounding whitespace trimmed.
 */
auto clean_value(std::string text) -> std::string {
    std::erase_if(text, [](char c) { return c == '\r' || c == '\n'; });
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

struct ReportParseState {
    DiskSnapshot snapshot;
    std::optional<DiskAttributes> current_disk;
    std::string current_field;
    std::string text;
    int depth = 0;
    int summary_depth = 0;

    [[nodiscard]] auto in_field() const -> bool {
        return current_disk.has_value() && depth == summary_depth + 1;
    }

    void finish_disk() {
        auto attributes = std::move(*current_disk);
        current_disk.reset();

        auto serial = attributes.find(disk_attr::SERIAL_NUMBER);
        if (serial == attributes.end() || serial->second.empty()) {
            LOG_WARNING(COMPONENT, "Found disk without serial number, skipping");
            return;
        }
        const auto serial_number = serial->second;
        snapshot[serial_number] = std::move(attributes);
    }
};

void on_start_element(GMarkupParseContext* /*context*/, const gchar* element_name,
                      const gchar** /*attribute_names*/, const gchar** /*attribute_values*/,
                      gpointer user_data, GError** /*error*/) {
    auto* state = static_cast<ReportParseState*>(user_data);
    ++state->depth;

    if (!state->current_disk && element_name == SUMMARY_ELEMENT) {
        state->current_disk.emplace();
        state->summary_depth = state->depth;
    } else if (state->in_field()) {
        state->current_field = element_name;
        state->text.clear();
    }
}

void on_end_element(GMarkupParseContext* /*context*/, const gchar* /*element_name*/,
                    gpointer user_data, GError** /*error*/) {
    auto* state = static_cast<ReportParseState*>(user_data);

    if (state->in_field()) {
        (*state->current_disk)[state->current_field] = clean_value(std::move(state->text));
        state->current_field.clear();
        state->text.clear();
    } else if (state->current_disk && state->depth == state->summary_depth) {
        state->finish_disk();
    }

    --state->depth;
}

void on_text(GMarkupParseContext* /*context*/, const gchar* text, gsize text_len,
             gpointer user_data, GError** /*error*/) {
    auto* state = static_cast<ReportParseState*>(user_data);
    if (state->in_field()) {
        state->text.append(text, text_len);
    }
}

const GMarkupParser report_parser = {
    .start_element = on_start_element,
    .end_element = on_end_element,
    .text = on_text,
    .passthrough = nullptr,
    .error = nullptr,
};

}  // namespace

XmlReportSnapshotSource::XmlReportSnapshotSource(XmlReportOptions options)
    : options_(std::move(options)) {
    if (options_.generated_report_path.empty()) {
        options_.generated_report_path =
            std::filesystem::path{g_get_tmp_dir()} / "hdsentinel-mqtt-report.xml";
    }
}

auto XmlReportSnapshotSource::take_snapshot() -> std::expected<DiskSnapshot, util::Error> {
    std::filesystem::path report_path;
    if (options_.report_path) {
        report_path = *options_.report_path;
        LOG_DEBUG(COMPONENT, std::format("hdsentinel_output: {}", report_path.string()));
    } else {
        auto generated = generate_report();
        if (!generated) {
            return std::unexpected(generated.error());
        }
        report_path = *generated;
    }

    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(report_path.c_str(), &contents, &length, &error)) {
        auto result = snapshot_error(std::format("Failed to read {}: {}", report_path.string(),
                                                 error ? error->message : "unknown error"));
        g_clear_error(&error);
        return result;
    }
    std::unique_ptr<gchar, decltype(&g_free)> owned{contents, g_free};

    LOG_INFO(COMPONENT, "Parsing xml with hdsentinel...");
    return parse_report(std::string_view{contents, length});
}

auto XmlReportSnapshotSource::generate_report()
    -> std::expected<std::filesystem::path, util::Error> {
    LOG_INFO(COMPONENT, "Generate xml with hdsentinel...");

    auto output = util::run_process({options_.hdsentinel_binary.string(), "-solid", "-xml", "-r",
                                     options_.generated_report_path.string()},
                                    options_.timeout);
    if (!output) {
        return snapshot_error(std::format("Failed to run HDSentinel: {}", output.error().message));
    }
    if (output->exit_code != 0) {
        return snapshot_error(
            std::format("Failed to run HDSentinel: exit status {}", output->exit_code));
    }
    return options_.generated_report_path;
}

auto XmlReportSnapshotSource::parse_report(std::string_view xml)
    -> std::expected<DiskSnapshot, util::Error> {
    std::string utf8_report;
    if (g_utf8_validate(xml.data(), static_cast<gssize>(xml.size()), nullptr)) {
        utf8_report.assign(xml);
    } else {
        gsize written = 0;
        GError* error = nullptr;
        gchar* converted = g_convert(xml.data(), static_cast<gssize>(xml.size()), "UTF-8",
                                     "ISO-8859-1", nullptr, &written, &error);
        if (!converted) {
            auto result = snapshot_error(std::format("Failed to convert report to UTF-8: {}",
                                                     error ? error->message : "unknown error"));
            g_clear_error(&error);
            return result;
        }
        utf8_report.assign(converted, written);
        g_free(converted);
    }

    ReportParseState state;
    GMarkupParseContext* context = g_markup_parse_context_new(
        &report_parser, static_cast<GMarkupParseFlags>(0), &state, nullptr);

    GError* error = nullptr;
    const bool parsed =
        g_markup_parse_context_parse(context, utf8_report.data(),
                                     static_cast<gssize>(utf8_report.size()), &error) &&
        g_markup_parse_context_end_parse(context, &error);
    g_markup_parse_context_free(context);

    if (!parsed) {
        auto result = snapshot_error(
            std::format("Failed to parse XML: {}", error ? error->message : "unknown error"));
        g_clear_error(&error);
        return result;
    }

    return std::move(state.snapshot);
}

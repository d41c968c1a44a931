/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "config/TemplateStore.hpp"
#include "core/PublishLoop.hpp"
#include "services/DeviceScanSnapshotSource.hpp"
#include "services/MosquittoTransport.hpp"
#include "services/XmlReportSnapshotSource.hpp"
#include "util/CancellationToken.hpp"
#include "util/Logger.hpp"
#include "util/SignalWatcher.hpp"

#include <format>
#include <iostream>
#include <utility>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "hdsentinel-mqtt";
constexpr auto COMPONENT = "CLI";

// Command line options
const struct option long_options[] = {
    {    "help",       no_argument, nullptr, 'h'},
    { "version",       no_argument, nullptr, 'V'},
    {    "host", required_argument, nullptr, 'H'},
    {    "port", required_argument, nullptr, 'p'},
    {     "tls",       no_argument, nullptr, 't'},
    {   "topic", required_argument, nullptr, 'T'},
    {"interval", required_argument, nullptr, 'i'},
    {     "xml", required_argument, nullptr, 'x'},
    {    "mode", required_argument, nullptr, 'm'},
    { "sensors", required_argument, nullptr, 's'},
    { "log-dir", required_argument, nullptr, 'L'},
    {   "debug",       no_argument, nullptr, 'd'},
    {   nullptr,                 0, nullptr,   0}
};

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.invalid) {
        print_help();
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    // Must exist before any worker thread so every thread inherits the blocked mask
    util::CancellationToken token;
    util::SignalWatcher signal_watcher{token};

    auto settings =
        config::load_settings(layer_overrides(config::process_environment(), options.overrides));
    if (!settings) {
        LOG_ERROR(COMPONENT, std::format("{}. Exiting.", settings.error().message));
        return 1;
    }

    LOG_INFO(COMPONENT, "Configure logging...");
    configure_logging(*settings);

    auto templates = config::load_sensor_templates(settings->sensors_config);
    if (!templates) {
        LOG_ERROR(COMPONENT, std::format("{}. Exiting.", templates.error().message));
        return 1;
    }
    LOG_DEBUG(COMPONENT, std::format("Loaded {} sensor templates from {}", templates->size(),
                                     settings->sensors_config.string()));

    core::PublishLoopOptions loop_options;
    loop_options.discovery.poll_interval = settings->poll_interval;
    loop_options.discovery.discovery_prefix = settings->discovery_prefix;
    loop_options.base_topic = settings->base_topic;

    LOG_INFO(COMPONENT, std::format("Configuring Home Assistant via MQTT Discovery... {}:{}",
                                    settings->mqtt.host, settings->mqtt.port));

    core::PublishLoop loop{make_snapshot_source(*settings),
                           std::make_shared<MosquittoTransport>(settings->mqtt),
                           std::move(*templates), std::move(loop_options)};
    const int exit_code = loop.run(token);

    LOG_INFO(COMPONENT, "Done.");
    util::Logger::instance().shutdown();
    return exit_code;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Full rescan, so repeated calls in one process start from argv[1]
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVH:p:tT:i:x:m:s:L:d", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'H':
                options.overrides["MQTT_HOST"] = optarg;
                break;
            case 'p':
                options.overrides["MQTT_PORT"] = optarg;
                break;
            case 't':
                options.overrides["MQTT_USE_TLS"] = "1";
                break;
            case 'T':
                options.overrides["MQTT_TOPIC"] = optarg;
                break;
            case 'i':
                options.overrides["HDSENTINEL_INTERVAL"] = optarg;
                break;
            case 'x':
                options.overrides["HDSENTINEL_XML_PATH"] = optarg;
                break;
            case 'm':
                options.overrides["HDSENTINEL_MODE"] = optarg;
                break;
            case 's':
                options.overrides["HDSENTINEL_SENSORS_CONFIG"] = optarg;
                break;
            case 'L':
                options.overrides["HDSENTINEL_LOG_DIR"] = optarg;
                break;
            case 'd':
                options.overrides["DEBUG"] = "1";
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    if (optind < argc) {
        options.invalid = true;
    }

    return options;
}

auto CliApplication::layer_overrides(config::EnvironmentLookup base,
                                     std::map<std::string, std::string> overrides)
    -> config::EnvironmentLookup {
    return [base = std::move(base), overrides = std::move(overrides)](
               const std::string& name) -> std::optional<std::string> {
        if (auto it = overrides.find(name); it != overrides.end()) {
            return it->second;
        }
        return base(name);
    };
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Publish Hard Disk Sentinel health data to Home Assistant over MQTT\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -H, --host <host>       MQTT broker host (MQTT_HOST, required)\n"
              << "  -p, --port <port>       MQTT broker port (MQTT_PORT, default: 1883)\n"
              << "  -t, --tls               Connect with TLS (MQTT_USE_TLS=1)\n"
              << "  -T, --topic <prefix>    Base topic (MQTT_TOPIC, default: hdsentinel)\n"
              << "  -i, --interval <sec>    Poll interval (HDSENTINEL_INTERVAL, default: 600)\n"
              << "  -x, --xml <file>        Read this XML report instead of running hdsentinel\n"
              << "                          (HDSENTINEL_XML_PATH, xml mode only)\n"
              << "  -m, --mode <mode>       Snapshot backend: xml or device (HDSENTINEL_MODE)\n"
              << "  -s, --sensors <file>    Sensor template file (HDSENTINEL_SENSORS_CONFIG)\n"
              << "  -L, --log-dir <dir>     Also log to rotating files (HDSENTINEL_LOG_DIR)\n"
              << "  -d, --debug             Enable debug logging (DEBUG=1)\n\n"
              << "Other environment variables:\n"
              << "  MQTT_USER, MQTT_PASSWORD  Broker credentials, used only as a pair\n"
              << "  MQTT_CA_PATH              CA directory for TLS (default: /etc/ssl/certs)\n"
              << "  MQTT_CLIENT_ID            Client id (default: hdsentinel-mqtt)\n"
              << "  HA_DISCOVERY_PREFIX       Discovery prefix (default: homeassistant)\n"
              << "  HDSENTINEL_BIN            Utility path (default: /usr/sbin/hdsentinel)\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --host broker.lan\n"
              << "  " << APP_NAME << " --host broker.lan --mode device --interval 300\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Hard Disk Sentinel to Home Assistant MQTT bridge\n";
}

void CliApplication::configure_logging(const config::Settings& settings) {
    auto& logger = util::Logger::instance();
    logger.set_min_level(settings.debug_logging ? util::LogLevel::DEBUG : util::LogLevel::INFO);

    if (settings.log_dir && !logger.enable_file_output(*settings.log_dir, APP_NAME)) {
        LOG_WARNING(COMPONENT, std::format("Cannot write logs to {}, using console only",
                                           settings.log_dir->string()));
    }
}

auto CliApplication::make_snapshot_source(const config::Settings& settings)
    -> std::shared_ptr<ISnapshotSource> {
    if (settings.snapshot_mode == config::SnapshotMode::DEVICE_SCAN) {
        LOG_INFO(COMPONENT, "Using per-device hdsentinel queries");
        return std::make_shared<DeviceScanSnapshotSource>(
            DeviceScanOptions{.hdsentinel_binary = settings.hdsentinel_binary,
                              .sys_block_dir = "/sys/block",
                              .timeout = std::chrono::minutes{2}});
    }

    return std::make_shared<XmlReportSnapshotSource>(
        XmlReportOptions{.hdsentinel_binary = settings.hdsentinel_binary,
                         .report_path = settings.xml_report_path,
                         .generated_report_path = {},
                         .timeout = std::chrono::minutes{2}});
}

}  // namespace cli

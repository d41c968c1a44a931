/**
 * @file CliApplication.hpp
 * @brief Command-line entry of the hdsentinel MQTT agent
 */

#pragma once

#include "config/Settings.hpp"

#include <map>
#include <memory>
#include <string>

class ISnapshotSource;

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 *
 * Options that configure the agent are kept as overrides of the
 * environment variable they stand for (e.g. --port -> MQTT_PORT).
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool invalid = false;
    std::map<std::string, std::string> overrides;
};

/**
 * @class CliApplication
 * @brief Loads configuration, wires the services together and runs the publish loop
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the agent until SIGINT/SIGTERM
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = clean shutdown, 1 = startup failure)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Environment lookup where @p overrides take precedence over @p base
     */
    [[nodiscard]] static auto layer_overrides(config::EnvironmentLookup base,
                                              std::map<std::string, std::string> overrides)
        -> config::EnvironmentLookup;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

private:
    static void configure_logging(const config::Settings& settings);

    [[nodiscard]] static auto make_snapshot_source(const config::Settings& settings)
        -> std::shared_ptr<ISnapshotSource>;
};

}  // namespace cli

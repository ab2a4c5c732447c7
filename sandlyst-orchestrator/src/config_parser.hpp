/**
 * @file config_parser.hpp
 * @brief Settings resolution for the analysis service
 *
 * Every setting is looked up by one ordered function, resolve_setting(key).
 * Sources (in priority order):
 * 1. Explicit overrides passed by the caller
 * 2. Environment variables: SANDLYST_<KEY>, then legacy aliases
 *    (QWEN_API_KEY, QWEN_API_URL, QWEN_MODEL, DOCKER_HOST)
 * 3. JSON configuration file (nested objects flatten to "<outer>_<inner>")
 * 4. .env file (same variable names as the environment)
 * 5. Built-in default
 */

#ifndef SANDLYST_ORCHESTRATOR_CONFIG_PARSER_HPP
#define SANDLYST_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "chat_planner.hpp"
#include "orchestrator.hpp"
#include "../../sandlyst-sandbox/src/sandbox_runner.hpp"
#include "../../sandlyst-sandbox/src/docker/docker_backend.hpp"
#include "../../sandlyst-sandbox/src/io/dataset_metadata.hpp"
#include "../../sandlyst-sandbox/src/logger.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>
#include <stdexcept>

namespace sandlyst {
namespace orchestrator {

/**
 * @brief Exception thrown when a configuration source cannot be read or a value is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Source a setting was resolved from
 */
enum class SettingSource {
    EXPLICIT,       ///< Caller override
    ENVIRONMENT,    ///< Process environment
    CONFIG_FILE,    ///< JSON configuration file
    DOTENV,         ///< .env file
    DEFAULT         ///< Not set anywhere
};

inline std::string source_to_string(SettingSource source) {
    switch (source) {
        case SettingSource::EXPLICIT: return "explicit";
        case SettingSource::ENVIRONMENT: return "environment";
        case SettingSource::CONFIG_FILE: return "config_file";
        case SettingSource::DOTENV: return "dotenv";
        case SettingSource::DEFAULT: return "default";
        default: return "unknown";
    }
}

/**
 * @brief Where settings may come from
 */
struct ConfigSources {
    std::map<std::string, std::string> overrides;   ///< Highest priority, keyed by setting name
    std::string config_file;                        ///< JSON file (empty: none)
    std::string dotenv_file;                        ///< .env file (empty: none, missing file: ignored)
    bool use_environment;

    ConfigSources() : use_environment(true) {}
};

/**
 * @brief Resolved setting value and its source
 */
struct ResolvedSetting {
    std::string value;
    SettingSource source;

    ResolvedSetting() : source(SettingSource::DEFAULT) {}
    ResolvedSetting(const std::string& value_, SettingSource source_)
        : value(value_), source(source_) {}
};

/**
 * @brief Ordered lookup over all configuration sources
 *
 * Files are read once at construction. Values from the JSON file have
 * environment references expanded, and path settings (results_dir,
 * sandbox_scratch_root, log_file) are resolved against the file's directory.
 */
class ConfigResolver {
public:
    /**
     * @throws ConfigParseError If the JSON file is missing or invalid
     */
    explicit ConfigResolver(const ConfigSources& sources);

    /**
     * @brief Resolve one setting
     * @return Value and source, or std::nullopt if no source sets it
     */
    std::optional<ResolvedSetting> resolve_setting(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value) const;

    /**
     * @throws ConfigParseError If the value is not an integer
     */
    int64_t get_int(const std::string& key, int64_t default_value) const;

    /**
     * @throws ConfigParseError If the value is not a number
     */
    double get_double(const std::string& key, double default_value) const;

    /**
     * @brief true/false, 1/0, yes/no, on/off (case-insensitive)
     * @throws ConfigParseError If the value is none of these
     */
    bool get_bool(const std::string& key, bool default_value) const;

    SettingSource source_of(const std::string& key) const;

private:
    ConfigSources sources_;
    std::map<std::string, std::string> file_values_;
    std::map<std::string, std::string> dotenv_values_;

    void load_config_file(const std::string& path);
    void load_dotenv_file(const std::string& path);
};

/**
 * @brief Environment variable names consulted for a setting, in order
 */
std::vector<std::string> environment_names(const std::string& key);

/**
 * @brief Everything the analysis service needs
 */
struct Settings {
    ChatPlannerConfig planner;
    DockerBackendConfig docker;
    SandboxConfig sandbox;
    OrchestratorConfig orchestrator;
    MetadataConfig metadata;
    LoggerConfig logging;
    bool verify_backend;        ///< Probe the backend at service startup

    Settings() : verify_backend(false) {}

    /**
     * @brief Human-readable summary with the planner key masked
     */
    std::string to_string() const;
};

/**
 * @brief Build Settings from all sources
 * @throws ConfigParseError On unreadable files or invalid values
 */
Settings load_settings(const ConfigSources& sources);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports ${VAR_NAME} and $VAR_NAME. Unset variables expand to "".
 * A '$' not followed by a name is kept literally.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory containing a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

/**
 * @brief Parse KEY=VALUE lines ("export" prefix, quotes and # comments allowed)
 */
std::map<std::string, std::string> parse_dotenv(const std::string& content);

} // namespace orchestrator
} // namespace sandlyst

#endif // SANDLYST_ORCHESTRATOR_CONFIG_PARSER_HPP

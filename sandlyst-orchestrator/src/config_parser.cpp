#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace sandlyst {
namespace orchestrator {

namespace {

const std::map<std::string, std::string> kLegacyAliases = {
    {"planner_api_key", "QWEN_API_KEY"},
    {"planner_api_url", "QWEN_API_URL"},
    {"planner_model", "QWEN_MODEL"},
    {"docker_host", "DOCKER_HOST"}
};

const std::vector<std::string> kPathSettings = {
    "results_dir",
    "sandbox_scratch_root",
    "log_file"
};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// {"planner": {"model": "x"}} -> planner_model = "x"
void flatten(const json& node, const std::string& prefix, std::map<std::string, std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "_" + it.key();
        if (it.value().is_object()) {
            flatten(it.value(), key, out);
        } else if (it.value().is_string()) {
            out[key] = expand_environment_variables(it.value().get<std::string>());
        } else if (!it.value().is_null()) {
            out[key] = it.value().dump();
        }
    }
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        size_t cursor = pos + 1;

        bool braces = false;
        if (cursor < result.size() && result[cursor] == '{') {
            braces = true;
            cursor++;
        }

        size_t name_start = cursor;
        while (cursor < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[cursor])) || result[cursor] == '_')) {
            cursor++;
        }
        size_t name_length = cursor - name_start;

        if (name_length == 0 || (braces && (cursor >= result.size() || result[cursor] != '}'))) {
            // Not a reference: keep the '$' as written
            pos = start + 1;
            continue;
        }
        if (braces) {
            cursor++; // Skip '}'
        }

        std::string var_name = result.substr(name_start, name_length);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, cursor - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

std::map<std::string, std::string> parse_dotenv(const std::string& content) {
    std::map<std::string, std::string> values;
    std::istringstream iss(content);
    std::string line;

    while (std::getline(iss, line)) {
        line = strip(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = strip(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = strip(line.substr(0, eq));
        std::string value = strip(line.substr(eq + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            size_t comment = value.find(" #");
            if (comment != std::string::npos) {
                value = strip(value.substr(0, comment));
            }
        }

        if (!key.empty()) {
            values[key] = value;
        }
    }
    return values;
}

std::vector<std::string> environment_names(const std::string& key) {
    std::vector<std::string> names = {"SANDLYST_" + to_upper(key)};
    auto alias = kLegacyAliases.find(key);
    if (alias != kLegacyAliases.end()) {
        names.push_back(alias->second);
    }
    return names;
}

// ========== ConfigResolver ==========

ConfigResolver::ConfigResolver(const ConfigSources& sources)
    : sources_(sources) {
    if (!sources_.config_file.empty()) {
        load_config_file(sources_.config_file);
    }
    if (!sources_.dotenv_file.empty()) {
        load_dotenv_file(sources_.dotenv_file);
    }
}

void ConfigResolver::load_config_file(const std::string& path) {
    std::string content = read_file(path);

    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigParseError("Config file must contain a JSON object: " + path);
    }

    flatten(j, "", file_values_);

    for (const auto& key : kPathSettings) {
        auto it = file_values_.find(key);
        if (it != file_values_.end() && !it->second.empty()) {
            it->second = resolve_relative_path(it->second, path);
        }
    }
}

void ConfigResolver::load_dotenv_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return;  // Optional source
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    dotenv_values_ = parse_dotenv(buffer.str());
}

std::optional<ResolvedSetting> ConfigResolver::resolve_setting(const std::string& key) const {
    auto explicit_value = sources_.overrides.find(key);
    if (explicit_value != sources_.overrides.end()) {
        return ResolvedSetting(explicit_value->second, SettingSource::EXPLICIT);
    }

    std::vector<std::string> names = environment_names(key);

    if (sources_.use_environment) {
        for (const auto& name : names) {
            const char* env_value = std::getenv(name.c_str());
            if (env_value && *env_value) {
                return ResolvedSetting(env_value, SettingSource::ENVIRONMENT);
            }
        }
    }

    auto file_value = file_values_.find(key);
    if (file_value != file_values_.end()) {
        return ResolvedSetting(file_value->second, SettingSource::CONFIG_FILE);
    }

    for (const auto& name : names) {
        auto dotenv_value = dotenv_values_.find(name);
        if (dotenv_value != dotenv_values_.end() && !dotenv_value->second.empty()) {
            return ResolvedSetting(dotenv_value->second, SettingSource::DOTENV);
        }
    }

    return std::nullopt;
}

std::string ConfigResolver::get_string(const std::string& key, const std::string& default_value) const {
    auto resolved = resolve_setting(key);
    return resolved ? resolved->value : default_value;
}

int64_t ConfigResolver::get_int(const std::string& key, int64_t default_value) const {
    auto resolved = resolve_setting(key);
    if (!resolved) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(resolved->value, &consumed);
        if (consumed != resolved->value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        throw ConfigParseError("Invalid integer for " + key + ": '" + resolved->value +
                               "' (from " + source_to_string(resolved->source) + ")");
    }
}

double ConfigResolver::get_double(const std::string& key, double default_value) const {
    auto resolved = resolve_setting(key);
    if (!resolved) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(resolved->value, &consumed);
        if (consumed != resolved->value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigParseError("Invalid number for " + key + ": '" + resolved->value +
                               "' (from " + source_to_string(resolved->source) + ")");
    }
}

bool ConfigResolver::get_bool(const std::string& key, bool default_value) const {
    auto resolved = resolve_setting(key);
    if (!resolved) {
        return default_value;
    }
    std::string value = to_lower(strip(resolved->value));
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw ConfigParseError("Invalid boolean for " + key + ": '" + resolved->value + "'");
}

SettingSource ConfigResolver::source_of(const std::string& key) const {
    auto resolved = resolve_setting(key);
    return resolved ? resolved->source : SettingSource::DEFAULT;
}

// ========== Settings ==========

std::string Settings::to_string() const {
    std::ostringstream oss;
    oss << "Settings{"
        << "planner_api_url=" << planner.api_url
        << ", planner_api_key=" << (planner.api_key.empty() ? "<none>" : Logger::mask_token(planner.api_key))
        << ", planner_model=" << planner.model
        << ", docker_host=" << docker.docker_host
        << ", sandbox_image=" << sandbox.image
        << ", sandbox_timeout_seconds=" << sandbox.limits.wall_clock_timeout_seconds
        << ", max_turns=" << orchestrator.max_turns
        << ", results_dir=" << orchestrator.results_dir
        << ", log_level=" << level_to_string(logging.min_level)
        << "}";
    return oss.str();
}

Settings load_settings(const ConfigSources& sources) {
    ConfigResolver resolver(sources);
    Settings settings;

    // Planner
    settings.planner.api_url = resolver.get_string("planner_api_url", settings.planner.api_url);
    settings.planner.api_key = resolver.get_string("planner_api_key", "");
    settings.planner.model = resolver.get_string("planner_model", settings.planner.model);
    settings.planner.temperature = resolver.get_double("planner_temperature", settings.planner.temperature);
    settings.planner.timeout_ms = static_cast<int>(
        resolver.get_int("planner_timeout_ms", settings.planner.timeout_ms));
    settings.planner.max_attempts = static_cast<int>(
        resolver.get_int("planner_max_attempts", settings.planner.max_attempts));

    // Docker
    settings.docker.docker_host = resolver.get_string("docker_host", settings.docker.docker_host);
    settings.docker.api_version = resolver.get_string("docker_api_version", settings.docker.api_version);
    settings.docker.request_timeout_ms = static_cast<int>(
        resolver.get_int("docker_request_timeout_ms", settings.docker.request_timeout_ms));
    settings.docker.max_log_bytes = static_cast<size_t>(resolver.get_int(
        "docker_max_log_bytes", static_cast<int64_t>(settings.docker.max_log_bytes)));

    // Sandbox
    settings.sandbox.image = resolver.get_string("sandbox_image", settings.sandbox.image);
    settings.sandbox.scratch_root = resolver.get_string("sandbox_scratch_root", settings.sandbox.scratch_root);
    settings.sandbox.limits.memory_bytes =
        resolver.get_int("sandbox_memory_bytes", settings.sandbox.limits.memory_bytes);
    settings.sandbox.limits.max_processes =
        resolver.get_int("sandbox_max_processes", settings.sandbox.limits.max_processes);
    double cpus = resolver.get_double("sandbox_cpus",
        static_cast<double>(settings.sandbox.limits.nano_cpus) / 1e9);
    settings.sandbox.limits.nano_cpus = static_cast<int64_t>(cpus * 1e9);
    settings.sandbox.limits.wall_clock_timeout_seconds = static_cast<int>(
        resolver.get_int("sandbox_timeout_seconds", settings.sandbox.limits.wall_clock_timeout_seconds));

    // Orchestrator
    settings.orchestrator.max_turns = static_cast<int>(
        resolver.get_int("max_turns", settings.orchestrator.max_turns));
    settings.orchestrator.feedback_limit_bytes = static_cast<size_t>(
        resolver.get_int("feedback_limit_bytes", static_cast<int64_t>(settings.orchestrator.feedback_limit_bytes)));
    settings.orchestrator.results_dir = resolver.get_string("results_dir", settings.orchestrator.results_dir);

    // Metadata
    settings.metadata.max_describe_bytes = static_cast<size_t>(resolver.get_int(
        "metadata_max_describe_bytes", static_cast<int64_t>(settings.metadata.max_describe_bytes)));
    settings.metadata.sample_count = static_cast<size_t>(resolver.get_int(
        "metadata_sample_count", static_cast<int64_t>(settings.metadata.sample_count)));

    // Logging
    settings.logging.min_level = string_to_level(to_upper(resolver.get_string("log_level", "INFO")));
    std::string log_file = resolver.get_string("log_file", "");
    if (!log_file.empty()) {
        settings.logging.enable_file = true;
        settings.logging.log_file_path = log_file;
    }
    settings.logging.enable_json = resolver.get_bool("log_json", settings.logging.enable_json);

    settings.verify_backend = resolver.get_bool("verify_backend", settings.verify_backend);

    // Validation
    if (settings.orchestrator.max_turns < 1) {
        throw ConfigParseError("max_turns must be at least 1");
    }
    if (settings.sandbox.limits.wall_clock_timeout_seconds < 1) {
        throw ConfigParseError("sandbox_timeout_seconds must be at least 1");
    }
    if (settings.sandbox.limits.memory_bytes <= 0 ||
        settings.sandbox.limits.max_processes <= 0 ||
        settings.sandbox.limits.nano_cpus <= 0) {
        throw ConfigParseError("sandbox resource limits must be positive");
    }
    if (settings.planner.max_attempts < 1) {
        throw ConfigParseError("planner_max_attempts must be at least 1");
    }

    return settings;
}

} // namespace orchestrator
} // namespace sandlyst

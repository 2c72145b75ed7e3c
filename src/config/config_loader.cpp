#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlmemo {

// ============================================================================
// TOML Parsing Helpers (includes, merging, placeholder expansion)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}: possible circular include", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

void expand_in_array(toml::array& arr, const PropertiesConfig& properties);

void expand_in_table(toml::table& tbl, const PropertiesConfig& properties) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_placeholders(s.get(), properties);
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_in_table(*val.as_table(), properties);
        } else if (val.is_array()) {
            expand_in_array(*val.as_array(), properties);
        }
    }
}

void expand_in_array(toml::array& arr, const PropertiesConfig& properties) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_placeholders(s.get(), properties);
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_in_table(*elem.as_table(), properties);
        } else if (elem.is_array()) {
            expand_in_array(*elem.as_array(), properties);
        }
    }
}

std::optional<std::string> lookup_placeholder(const std::string& name, const PropertiesConfig& properties) {
    const auto it = properties.values.find(name);
    if (it != properties.values.end()) {
        return it->second;
    }
    if (const char* env_val = std::getenv(name.c_str())) {
        return std::string(env_val);
    }
    return std::nullopt;
}

// Scalar property value as text; nullopt for tables and arrays
std::optional<std::string> scalar_text(const toml::node& node) {
    if (const auto* s = node.as_string()) return std::string(s->get());
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* b = node.as_boolean()) return b->get() ? "true"s : "false"s;
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    return std::nullopt;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<LocalCacheScope> ConfigLoader::parse_local_cache_scope(const std::string& scope_str) {
    const std::string lower = utils::to_lower(scope_str);

    static const std::unordered_map<std::string, LocalCacheScope> lookup = {
        {"session",   LocalCacheScope::SESSION},
        {"statement", LocalCacheScope::STATEMENT},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<utils::log::Level> ConfigLoader::parse_log_level(const std::string& level_str) {
    const std::string lower = utils::to_lower(level_str);

    static const std::unordered_map<std::string, utils::log::Level> lookup = {
        {"debug",   utils::log::Level::DEBUG},
        {"info",    utils::log::Level::INFO},
        {"warn",    utils::log::Level::WARN},
        {"warning", utils::log::Level::WARN},
        {"error",   utils::log::Level::ERROR},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::string ConfigLoader::expand_placeholders(const std::string& input, const PropertiesConfig& properties) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed placeholder at position {}", i));
            }
            const std::string expression = input.substr(i + 2, close - i - 2);

            std::string name = expression;
            std::optional<std::string> default_value;
            if (properties.enable_default_value && !properties.default_value_separator.empty()) {
                const auto sep = expression.find(properties.default_value_separator);
                if (sep != std::string::npos) {
                    name = expression.substr(0, sep);
                    default_value = expression.substr(sep + properties.default_value_separator.size());
                }
            }

            if (auto value = lookup_placeholder(name, properties)) {
                result += *value;
            } else if (default_value) {
                result += *default_value;
            } else {
                result.append(input, i, close - i + 1);
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

SessionSettings ConfigLoader::extract_session(const toml::table& root, std::vector<std::string>& errors) {
    SessionSettings cfg;
    const auto* session = root["session"].as_table();
    if (!session) return cfg;
    const auto& s = *session;

    const std::string scope = s["local_cache_scope"].value_or("session"s);
    if (const auto parsed = parse_local_cache_scope(scope)) {
        cfg.local_cache_scope = *parsed;
    } else {
        errors.push_back(std::format("session.local_cache_scope must be 'session' or 'statement', got '{}'", scope));
    }
    cfg.lazy_loading_enabled = s["lazy_loading_enabled"].value_or(true);
    cfg.autocommit = s["autocommit"].value_or(false);
    return cfg;
}

std::optional<EnvironmentConfig> ConfigLoader::extract_environment(const toml::table& root) {
    const auto* environment = root["environment"].as_table();
    if (!environment) return std::nullopt;

    EnvironmentConfig cfg;
    cfg.id = (*environment)["id"].value_or(""s);
    cfg.connection_string = (*environment)["connection_string"].value_or(""s);
    return cfg;
}

PropertiesConfig ConfigLoader::extract_properties(const toml::table& root) {
    PropertiesConfig cfg;
    const auto* properties = root["properties"].as_table();
    if (!properties) return cfg;

    cfg.enable_default_value = (*properties)["enable_default_value"].value_or(false);
    cfg.default_value_separator = (*properties)["default_value_separator"].value_or(":"s);

    for (const auto& [key, val] : *properties) {
        const std::string name(key.str());
        if (name == "enable_default_value" || name == "default_value_separator") continue;
        if (auto text = scalar_text(val)) {
            cfg.values[name] = std::move(*text);
        }
    }
    return cfg;
}

SqlMemoConfig ConfigLoader::extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    SqlMemoConfig config;
    config.logging = extract_logging(tbl);
    config.session = extract_session(tbl, errors);
    config.environment = extract_environment(tbl);
    config.properties = extract_properties(tbl);
    return config;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SqlMemoConfig& config) {
    std::vector<std::string> errors;

    if (!parse_log_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.environment && config.environment->id.empty()) {
        errors.push_back("environment.id required when [environment] is present");
    }

    if (config.properties.enable_default_value && config.properties.default_value_separator.empty()) {
        errors.push_back("properties.default_value_separator must not be empty");
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::load_table(toml::table tbl) {
    // Properties resolve from the environment only; everything else sees them
    auto properties = extract_properties(tbl);
    PropertiesConfig env_only = properties;
    env_only.values.clear();
    for (auto& [name, value] : properties.values) {
        value = expand_placeholders(value, env_only);
    }

    for (auto& [key, val] : tbl) {
        if (key.str() == "properties") continue;
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_placeholders(s.get(), properties);
        } else if (val.is_table()) {
            expand_in_table(*val.as_table(), properties);
        } else if (val.is_array()) {
            expand_in_array(*val.as_array(), properties);
        }
    }

    std::vector<std::string> errors;
    auto config = extract_all_sections(tbl, errors);
    config.properties = std::move(properties);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return load_table(parse_toml_file(config_path));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return load_table(toml::parse(toml_content));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace sqlmemo

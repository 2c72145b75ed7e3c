#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sqlmemo {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sqlmemo.toml
 *
 * Sections: [logging], [session], [environment], [properties].
 * - `include = "x.toml"` (or an array) deep-merges other files first;
 *   the including file wins. Cycles and nesting deeper than 10 fail.
 * - `${NAME}` in any string is replaced from [properties], then from the
 *   process environment. Unresolved placeholders stay as written.
 * - With properties.enable_default_value, `${NAME:default}` falls back
 *   to `default` (separator configurable).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SqlMemoConfig config;

        static LoadResult ok(SqlMemoConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlmemo.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Replace ${NAME} / ${NAME<sep>default} placeholders
     * @throws std::runtime_error on an unclosed placeholder
     */
    [[nodiscard]] static std::string expand_placeholders(const std::string& input,
                                                         const PropertiesConfig& properties);

    // Helpers: parse enum strings (case-insensitive)
    [[nodiscard]] static std::optional<LocalCacheScope> parse_local_cache_scope(const std::string& scope_str);
    [[nodiscard]] static std::optional<utils::log::Level> parse_log_level(const std::string& level_str);

private:
    static SqlMemoConfig extract_all_sections(const toml::table& root, std::vector<std::string>& errors);
    static LoggingConfig extract_logging(const toml::table& root);
    static SessionSettings extract_session(const toml::table& root, std::vector<std::string>& errors);
    static std::optional<EnvironmentConfig> extract_environment(const toml::table& root);
    static PropertiesConfig extract_properties(const toml::table& root);

    static std::vector<std::string> validate_config(const SqlMemoConfig& config);
    static LoadResult load_table(toml::table tbl);
};

} // namespace sqlmemo

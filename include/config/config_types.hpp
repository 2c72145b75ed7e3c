#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace sqlmemo {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";       // debug | info | warn | error
};

struct SessionSettings {
    LocalCacheScope local_cache_scope = LocalCacheScope::SESSION;
    bool lazy_loading_enabled = true;
    bool autocommit = false;
};

struct EnvironmentConfig {
    std::string id;
    std::string connection_string;    // libpq conninfo; empty = no data source
};

// ${NAME} / ${NAME:default} substitution
struct PropertiesConfig {
    bool enable_default_value = false;
    std::string default_value_separator = ":";
    std::unordered_map<std::string, std::string> values;
};

struct SqlMemoConfig {
    LoggingConfig logging;
    SessionSettings session;
    std::optional<EnvironmentConfig> environment;
    PropertiesConfig properties;
};

} // namespace sqlmemo

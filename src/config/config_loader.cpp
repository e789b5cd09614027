#include "config/config_loader.hpp"
#include "config/connection_url.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace polydb {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// Integers are accepted as strings too ("database = 2" and "database = '2'")
std::optional<std::string> toml_string_or_integer(const toml::table& tbl, const std::string_view key) {
    if (auto s = toml_optional_string(tbl, key)) {
        return s;
    }
    if (const auto* v = tbl[key].as_integer()) {
        return std::to_string(v->get());
    }
    return std::nullopt;
}

size_t toml_size(const toml::table& tbl, const std::string_view key, const size_t fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    return v < 0 ? 0 : static_cast<size_t>(v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

PoolConfig ConfigLoader::extract_pool(const toml::table& root) {
    PoolConfig cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.min_connections = toml_size(p, "min_connections", cfg.min_connections);
    cfg.max_connections = toml_size(p, "max_connections", cfg.max_connections);
    cfg.connection_timeout = std::chrono::milliseconds(
        p["connection_timeout_ms"].value_or(static_cast<int64_t>(cfg.connection_timeout.count())));
    cfg.idle_timeout = std::chrono::seconds(p["idle_timeout_seconds"].value_or(int64_t{300}));
    cfg.max_lifetime = std::chrono::seconds(p["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.health_check_query = p["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

RedisOptions ConfigLoader::extract_redis(const toml::table& root) {
    RedisOptions cfg;
    const auto* redis = root["redis"].as_table();
    if (!redis) return cfg;
    const auto& r = *redis;

    cfg.max_connections = toml_size(r, "max_connections", cfg.max_connections);
    cfg.connect_timeout = std::chrono::milliseconds(
        r["connect_timeout_ms"].value_or(static_cast<int64_t>(cfg.connect_timeout.count())));
    cfg.database_count = toml_size(r, "database_count", cfg.database_count);
    return cfg;
}

std::vector<ConnectionDescriptor> ConfigLoader::extract_connections(
    const toml::table& root, std::vector<std::string>& errors) {

    std::vector<ConnectionDescriptor> result;
    const auto* arr = root["connections"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    size_t position = 0;
    for (const auto& elem : *arr) {
        ++position;
        const auto* tbl = elem.as_table();
        if (!tbl) {
            errors.push_back(std::format("connections[{}]: expected a table", position));
            continue;
        }
        const auto& c = *tbl;

        ConnectionDescriptor descriptor;
        bool has_type = false;

        // URL first, explicit fields layered on top
        if (auto url = toml_optional_string(c, "url")) {
            auto parsed = parse_connection_url(*url);
            if (parsed.is_error()) {
                errors.push_back(std::format("connections[{}]: {}", position, parsed.error_message()));
                continue;
            }
            descriptor = std::move(parsed.value());
            has_type = true;
        }

        descriptor.id = c["id"].value_or(""s);
        descriptor.name = toml_optional_string(c, "name").value_or(descriptor.id);
        const std::string label = descriptor.id.empty()
            ? std::format("connections[{}]", position)
            : std::format("Connection '{}'", descriptor.id);

        if (auto type_str = toml_optional_string(c, "type")) {
            const auto type = parse_database_type(*type_str);
            if (!type) {
                errors.push_back(std::format("{}: unknown type '{}'", label, *type_str));
                continue;
            }
            if (descriptor.type != *type || !has_type) {
                descriptor.port = 0;
            }
            descriptor.type = *type;
            has_type = true;
        }
        if (!has_type) {
            errors.push_back(std::format("{}: either 'type' or 'url' is required", label));
            continue;
        }

        if (auto host = toml_optional_string(c, "host")) descriptor.host = std::move(*host);
        if (auto user = toml_optional_string(c, "username")) descriptor.username = std::move(*user);
        if (auto pass = toml_optional_string(c, "password")) descriptor.password = std::move(*pass);
        if (auto db = toml_string_or_integer(c, "database")) descriptor.database = std::move(*db);

        if (const auto port = c["port"].value<int64_t>()) {
            if (*port < 0 || *port > std::numeric_limits<uint16_t>::max()) {
                errors.push_back(std::format("{}: invalid port {}", label, *port));
                continue;
            }
            descriptor.port = static_cast<uint16_t>(*port);
        }
        if (descriptor.port == 0) {
            descriptor.port = default_port(descriptor.type);
        }

        result.emplace_back(std::move(descriptor));
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    CoreConfig config;
    config.logging = extract_logging(root);
    config.drivers.pool = extract_pool(root);
    config.drivers.redis = extract_redis(root);
    config.connections = extract_connections(root, errors);

    auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

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
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CoreConfig& config) {
    std::vector<std::string> errors;

    const std::string level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level: unknown level '{}'", config.logging.level));
    }

    const auto& pool = config.drivers.pool;
    if (pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be at least 1");
    }
    if (pool.min_connections > pool.max_connections) {
        errors.push_back(std::format("pool.min_connections ({}) exceeds pool.max_connections ({})",
                                     pool.min_connections, pool.max_connections));
    }
    if (pool.connection_timeout.count() <= 0) {
        errors.push_back("pool.connection_timeout_ms must be positive");
    }
    if (config.drivers.redis.max_connections == 0) {
        errors.push_back("redis.max_connections must be at least 1");
    }

    std::unordered_set<std::string> seen;
    for (const auto& c : config.connections) {
        if (c.id.empty()) {
            errors.push_back("Connection is missing 'id'");
            continue;
        }
        if (!seen.insert(c.id).second) {
            errors.push_back(std::format("Duplicate connection id '{}'", c.id));
        }
        if ((c.type == DatabaseType::POSTGRESQL || c.type == DatabaseType::MYSQL) && c.host.empty()) {
            errors.push_back(std::format("Connection '{}': missing host", c.id));
        }
    }
    return errors;
}

} // namespace polydb

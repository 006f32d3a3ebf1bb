#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace pgsession {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
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

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 *
 * A shared team file can hold defaults while a per-checkout file overrides
 * the port or storage location.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
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

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    } else if (const auto* s = tbl[key].as_string()) {
        result.emplace_back(s->get());
    }
    return result;
}

// Integer key bounded to [0, max]; out-of-range values are load errors
template<typename T>
T toml_bounded_uint(const toml::table& tbl, const std::string_view section,
                    const std::string_view key, const T default_val,
                    const int64_t max = std::numeric_limits<T>::max()) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return default_val;
    if (*v < 0 || *v > max) {
        throw std::runtime_error(std::format("{}.{} must be 0-{}, got {}", section, key, max, *v));
    }
    return static_cast<T>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

void ConfigLoader::extract_session(const toml::table& root, SessionOptions& opts) {
    const auto* session = root["session"].as_table();
    if (!session) return;
    const auto& s = *session;

    opts.project_root = s["project_root"].value_or(""s);
    opts.db_path = s["db_path"].value_or(""s);
    opts.db_name = s["db_name"].value_or(""s);
    opts.port = toml_bounded_uint<uint16_t>(s, "session", "port", 0, 65535);
}

void ConfigLoader::extract_engine(const toml::table& root, SessionOptions& opts) {
    const auto* engine = root["engine"].as_table();
    if (!engine) return;
    opts.engine_libraries = toml_string_array(*engine, "library");
}

NativeOptions ConfigLoader::extract_native(const toml::table& root) {
    NativeOptions cfg;
    const auto* native = root["native"].as_table();
    if (!native) return cfg;
    const auto& n = *native;

    cfg.initdb = n["initdb"].value_or("initdb"s);
    cfg.postgres = n["postgres"].value_or("postgres"s);
    cfg.log_file = n["log_file"].value_or(""s);
    cfg.log_truncate = n["log_truncate"].value_or(true);
    cfg.verbose = n["verbose"].value_or(false);
    cfg.shutdown_timeout_ms = toml_bounded_uint<uint32_t>(
        n, "native", "shutdown_timeout_ms", cfg.shutdown_timeout_ms);
    return cfg;
}

ReadinessOptions ConfigLoader::extract_readiness(const toml::table& root) {
    ReadinessOptions cfg;
    const auto* readiness = root["readiness"].as_table();
    if (!readiness) return cfg;
    const auto& r = *readiness;

    cfg.max_attempts = toml_bounded_uint<uint32_t>(r, "readiness", "max_attempts", cfg.max_attempts);
    cfg.interval_ms = toml_bounded_uint<uint32_t>(r, "readiness", "interval_ms", cfg.interval_ms);
    return cfg;
}

GatewayOptions ConfigLoader::extract_gateway(const toml::table& root) {
    GatewayOptions cfg;
    const auto* gateway = root["gateway"].as_table();
    if (!gateway) return cfg;
    const auto& g = *gateway;

    cfg.server_version = g["server_version"].value_or(cfg.server_version);
    cfg.max_connections = toml_bounded_uint<uint32_t>(
        g, "gateway", "max_connections", cfg.max_connections);
    cfg.default_user = g["default_user"].value_or(cfg.default_user);
    cfg.default_password = g["default_password"].value_or(cfg.default_password);
    return cfg;
}

SeedOptions ConfigLoader::extract_seed(const toml::table& root) {
    SeedOptions cfg;
    const auto* seed = root["seed"].as_table();
    if (!seed) return cfg;
    cfg.command = (*seed)["command"].value_or(""s);
    return cfg;
}

LoggingOptions ConfigLoader::extract_logging(const toml::table& root) {
    LoggingOptions cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

SessionOptions ConfigLoader::extract_all_sections(const toml::table& root) {
    SessionOptions opts;
    extract_session(root, opts);
    extract_engine(root, opts);
    opts.native = extract_native(root);
    opts.readiness = extract_readiness(root);
    opts.gateway = extract_gateway(root);
    opts.seed = extract_seed(root);
    opts.logging = extract_logging(root);
    return opts;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate(const SessionOptions& options) {
    std::vector<std::string> errors;

    if (options.readiness.max_attempts < 1) {
        errors.emplace_back("readiness.max_attempts must be >= 1");
    }
    if (options.readiness.interval_ms < 1) {
        errors.emplace_back("readiness.interval_ms must be >= 1");
    }
    if (options.gateway.max_connections < 1) {
        errors.emplace_back("gateway.max_connections must be >= 1");
    }
    if (options.native.initdb.empty()) {
        errors.emplace_back("native.initdb must not be empty");
    }
    if (options.native.postgres.empty()) {
        errors.emplace_back("native.postgres must not be empty");
    }
    if (!utils::log::parse_level(options.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            options.logging.level));
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SessionOptions options) {
    const auto errors = validate(options);
    if (errors.empty()) {
        return LoadResult::ok(std::move(options));
    }

    std::string message = "Config validation failed:";
    for (const auto& e : errors) {
        message += "\n  - ";
        message += e;
    }
    return LoadResult::error(std::move(message));
}

} // namespace pgsession

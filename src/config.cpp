#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "jsonhlp.hpp"
#include "lib.hpp"

namespace fs = std::filesystem;

Config Config::from_json(const nlohmann::json& j, const std::string& base_dir) {
    if (!j.is_object()) THROW("Configuration must be a JSON object");
    Config c;
    try {
        c.dsn = j.value("dsn", c.dsn);
        c.driver = j.value("driver", c.driver);
        c.migration_dir = j.value("migration_dir", c.migration_dir);
        c.log_level = j.value("log_level", c.log_level);
        c.pool_size = j.value("pool_size", c.pool_size);
        c.statement_timeout_ms = j.value("statement_timeout_ms", c.statement_timeout_ms);
        c.index_length = j.value("index_length", c.index_length);
    } catch (const nlohmann::json::exception& e) {
        THROW("Invalid configuration value: %s", e.what());
    }

    if (c.driver != "postgres" && c.driver != "sqlite")
        THROW("Invalid driver '%s': expected postgres or sqlite", c.driver.c_str());
    if (c.pool_size < 1) THROW("pool_size must be >= 1");
    if (c.statement_timeout_ms < 0) THROW("statement_timeout_ms must be >= 0");
    if (c.index_length < 1 || c.index_length > 18) THROW("index_length must be in 1..18");

    if (fs::path(c.migration_dir).is_relative())
        c.migration_dir = (fs::path(base_dir) / c.migration_dir).lexically_normal().string();

    if (j.contains("models")) {
        const auto& m = j["models"];
        if (m.is_string()) {
            fs::path p = m.get<std::string>();
            if (p.is_relative()) p = fs::path(base_dir) / p;
            c.models_file = p.lexically_normal().string();
        } else if (m.is_array()) {
            c.models_json = m.dump();
        } else {
            THROW("'models' must be a file path or an array of models");
        }
    }

    if (const char* env = std::getenv(ENV_DSN); env && *env) c.dsn = env;
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) THROW("Can not open configuration file: %s", path.c_str());
    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        THROW("Invalid JSON file %s: %s", path.c_str(), e.what());
    }
    std::string base = fs::path(path).parent_path().string();
    return from_json(j, base.empty() ? "." : base);
}

ModelRegistry Config::load_models() const {
    if (!models_file.empty()) return ModelRegistry::from_file(models_file);
    if (!models_json.empty()) {
        jdoc doc;
        if (!jhlp::parse_str(models_json, doc)) THROW("Invalid inline models");
        return ModelRegistry::from_json(doc);
    }
    THROW("No models configured");
}

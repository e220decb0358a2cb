#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "model.hpp"

#define ENV_DSN "ORMIGRATE_DSN"

/**
 * Config
 *  - ormigrate.json: dsn, driver, migration_dir, models, log_level,
 *    pool_size, statement_timeout_ms, index_length
 *  - ORMIGRATE_DSN overrides dsn
 *  - "models" is a path (relative to the config file) or an inline array
 */
struct Config {
    std::string dsn;
    std::string driver = "postgres";
    std::string migration_dir = "./migrations";
    std::string log_level = "info";
    int pool_size = 1;
    int statement_timeout_ms = 0;
    int index_length = 8;

    std::string models_file;     // set when "models" is a path
    std::string models_json;     // inline "models" array, serialized

    ModelRegistry load_models() const;

    static Config from_json(const nlohmann::json& j, const std::string& base_dir = ".");
    static Config load(const std::string& path);
};

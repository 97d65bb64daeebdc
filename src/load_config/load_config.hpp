#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ConfigReader
{
    // Throws errors::SyncError(Validation) if the file is missing or not JSON.
    json load(const std::string &filepath);
    bool save(const std::string &filepath, const json &j);

    // Typed getters. A missing key yields the fallback; a key of the wrong
    // type is logged and also yields the fallback.
    int64_t get_config_value(const std::string &key, const json &j, int64_t fallback = 0);
    double get_config_double(const std::string &key, const json &j, double fallback = 0.0);
    bool get_config_bool(const std::string &key, const json &j, bool fallback = false);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
}

namespace config
{
    struct EngineConfig
    {
        std::string store_path = "data/capsync.db";
        std::string server_url = "http://localhost:8080";
        std::string auth_token;

        int64_t chunk_size_bytes = 5 * 1024 * 1024;
        int64_t transport_timeout_ms = 30000;
        int transport_retries = 3;

        int queue_max_retries = 3;
        int64_t backoff_base_ms = 2000;
        int64_t backoff_cap_ms = 5 * 60 * 1000;

        int64_t periodic_interval_ms = 15 * 60 * 1000;
        int64_t connectivity_poll_ms = 5000;
        int64_t conflict_tolerance_ms = 1000;
        int sync_batch_size = 100;
        int sync_retries = 3;

        std::string log_file = "capsync.log";
        std::string log_level = "info";
        std::string processor_command;
    };

    // Reads every known key from j, keeping defaults for absent ones.
    // Rejects values that would break an invariant (non-positive sizes...).
    EngineConfig fromJson(const json &j);
    json toJson(const EngineConfig &cfg);

    EngineConfig loadEngineConfig(const std::string &filepath);
} // namespace config

#endif // LOAD_CONFIG_HPP

#include "load_config.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <fstream>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw errors::validationError("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw errors::validationError("Malformed config file " + filepath + ": " + e.what());
        }
    }

    bool save(const std::string &filepath, const json &j)
    {
        std::ofstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file for writing: " + filepath);
            return false;
        }
        config_file << j.dump(4);
        if (!config_file)
        {
            MyLogger::error("Error writing configuration file: " + filepath);
            return false;
        }
        MyLogger::info("Configuration file saved successfully: " + filepath);
        return true;
    }

    int64_t get_config_value(const std::string &key, const json &j, int64_t fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<int64_t>();
    }

    double get_config_double(const std::string &key, const json &j, double fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_number())
        {
            MyLogger::error("Key is not a number: " + key);
            return fallback;
        }
        return j[key].get<double>();
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_boolean())
        {
            MyLogger::error("Key is not a boolean: " + key);
            return fallback;
        }
        return j[key].get<bool>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }
}

namespace config
{
    namespace
    {
        void requirePositive(const std::string &key, int64_t value)
        {
            if (value <= 0)
                throw errors::validationError("Config value '" + key + "' must be positive");
        }
    }

    EngineConfig fromJson(const json &j)
    {
        EngineConfig cfg;
        cfg.store_path = ConfigReader::get_config_string("store_path", j, cfg.store_path);
        cfg.server_url = ConfigReader::get_config_string("server_url", j, cfg.server_url);
        cfg.auth_token = ConfigReader::get_config_string("auth_token", j, cfg.auth_token);

        cfg.chunk_size_bytes = ConfigReader::get_config_value("chunk_size_bytes", j, cfg.chunk_size_bytes);
        cfg.transport_timeout_ms = ConfigReader::get_config_value("transport_timeout_ms", j, cfg.transport_timeout_ms);
        cfg.transport_retries = static_cast<int>(ConfigReader::get_config_value("transport_retries", j, cfg.transport_retries));

        cfg.queue_max_retries = static_cast<int>(ConfigReader::get_config_value("queue_max_retries", j, cfg.queue_max_retries));
        cfg.backoff_base_ms = ConfigReader::get_config_value("backoff_base_ms", j, cfg.backoff_base_ms);
        cfg.backoff_cap_ms = ConfigReader::get_config_value("backoff_cap_ms", j, cfg.backoff_cap_ms);

        cfg.periodic_interval_ms = ConfigReader::get_config_value("periodic_interval_ms", j, cfg.periodic_interval_ms);
        cfg.connectivity_poll_ms = ConfigReader::get_config_value("connectivity_poll_ms", j, cfg.connectivity_poll_ms);
        cfg.conflict_tolerance_ms = ConfigReader::get_config_value("conflict_tolerance_ms", j, cfg.conflict_tolerance_ms);
        cfg.sync_batch_size = static_cast<int>(ConfigReader::get_config_value("sync_batch_size", j, cfg.sync_batch_size));
        cfg.sync_retries = static_cast<int>(ConfigReader::get_config_value("sync_retries", j, cfg.sync_retries));

        cfg.log_file = ConfigReader::get_config_string("log_file", j, cfg.log_file);
        cfg.log_level = ConfigReader::get_config_string("log_level", j, cfg.log_level);
        cfg.processor_command = ConfigReader::get_config_string("processor_command", j, cfg.processor_command);

        requirePositive("chunk_size_bytes", cfg.chunk_size_bytes);
        requirePositive("transport_timeout_ms", cfg.transport_timeout_ms);
        requirePositive("backoff_base_ms", cfg.backoff_base_ms);
        requirePositive("backoff_cap_ms", cfg.backoff_cap_ms);
        requirePositive("periodic_interval_ms", cfg.periodic_interval_ms);
        requirePositive("connectivity_poll_ms", cfg.connectivity_poll_ms);
        requirePositive("sync_batch_size", cfg.sync_batch_size);
        if (cfg.queue_max_retries < 0 || cfg.transport_retries < 0 || cfg.sync_retries < 0)
            throw errors::validationError("Retry counts must not be negative");
        if (cfg.conflict_tolerance_ms < 0)
            throw errors::validationError("Config value 'conflict_tolerance_ms' must not be negative");
        return cfg;
    }

    json toJson(const EngineConfig &cfg)
    {
        return json{
            {"store_path", cfg.store_path},
            {"server_url", cfg.server_url},
            {"auth_token", cfg.auth_token},
            {"chunk_size_bytes", cfg.chunk_size_bytes},
            {"transport_timeout_ms", cfg.transport_timeout_ms},
            {"transport_retries", cfg.transport_retries},
            {"queue_max_retries", cfg.queue_max_retries},
            {"backoff_base_ms", cfg.backoff_base_ms},
            {"backoff_cap_ms", cfg.backoff_cap_ms},
            {"periodic_interval_ms", cfg.periodic_interval_ms},
            {"connectivity_poll_ms", cfg.connectivity_poll_ms},
            {"conflict_tolerance_ms", cfg.conflict_tolerance_ms},
            {"sync_batch_size", cfg.sync_batch_size},
            {"sync_retries", cfg.sync_retries},
            {"log_file", cfg.log_file},
            {"log_level", cfg.log_level},
            {"processor_command", cfg.processor_command}};
    }

    EngineConfig loadEngineConfig(const std::string &filepath)
    {
        auto cfg = fromJson(ConfigReader::load(filepath));
        MyLogger::info("Engine config: server=" + cfg.server_url + " store=" + cfg.store_path +
                       " chunk=" + std::to_string(cfg.chunk_size_bytes) + " bytes");
        return cfg;
    }
} // namespace config

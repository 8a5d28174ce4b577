#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "polystore/logging.hpp"

namespace polystore {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        // Environment first, the file overrides
        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        return convert<T>(key, it->second, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Drop every value (tests reload from scratch)
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            if (key == "db.password") {
                LOG_INFO("  ", key, " = ****");
            } else {
                LOG_INFO("  ", key, " = ", value);
            }
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    static T convert(const std::string& key, const std::string& raw, T default_value) {
        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(raw);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::stoll(raw);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                if (!raw.empty() && raw[0] == '-') return default_value;
                return std::stoull(raw);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(raw);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = raw;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return raw;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        // Ingest pipeline
        set_if_env("chunk.size", "PS_CHUNK_SIZE", "5242880");
        set_if_env("upload.max_attempts", "PS_UPLOAD_MAX_ATTEMPTS", "3");
        set_if_env("upload.retry_delay_ms", "PS_UPLOAD_RETRY_DELAY_MS", "5000");

        // Durable sinks
        set_if_env("failure_log.path", "PS_FAILURE_LOG", "polystore_failures.jsonl");
        set_if_env("journal.path", "PS_JOURNAL", "polystore_journal.log");
        set_if_env("chunk_store.dir", "PS_CHUNK_DIR", "polystore_chunks");
        set_if_env("vector.index_path", "PS_VECTOR_INDEX", "polystore_vectors.hnsw");

        // Database configuration
        set_if_env("db.host", "PS_DB_HOST", "localhost");
        set_if_env("db.port", "PS_DB_PORT", "5432");
        set_if_env("db.user", "PS_DB_USER", "postgres");
        set_if_env("db.password", "PS_DB_PASS", "");
        set_if_env("db.name", "PS_DB_NAME", "polystore");

        // Logging configuration
        set_if_env("log.level", "PS_LOG_LEVEL", "info");
        set_if_env("log.file", "PS_LOG_FILE", "");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Called with mutex_ held; reads values_ directly
    bool validate() {
        bool valid = true;

        auto raw = [this](const std::string& key) -> std::string {
            auto it = values_.find(key);
            return it == values_.end() ? std::string() : it->second;
        };

        if (convert<uint64_t>("chunk.size", raw("chunk.size"), 0) == 0) {
            LOG_ERROR("Invalid chunk size: '", raw("chunk.size"), "'");
            valid = false;
        }

        if (convert<int>("upload.max_attempts", raw("upload.max_attempts"), 0) < 1) {
            LOG_ERROR("upload.max_attempts must be at least 1, got '", raw("upload.max_attempts"), "'");
            valid = false;
        }

        if (convert<int64_t>("upload.retry_delay_ms", raw("upload.retry_delay_ms"), -1) < 0) {
            LOG_ERROR("Invalid retry delay: '", raw("upload.retry_delay_ms"), "'");
            valid = false;
        }

        int port = convert<int>("db.port", raw("db.port"), 0);
        if (port <= 0 || port > 65535) {
            LOG_ERROR("Invalid database port: ", raw("db.port"));
            valid = false;
        }

        std::string log_level = raw("log.level");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "off") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Tunables for one streaming ingest service
struct IngestOptions {
    uint64_t chunk_size = 5 * 1024 * 1024;
    int max_attempts = 3;
    std::chrono::milliseconds retry_delay{5000};
    std::string failure_log_path = "polystore_failures.jsonl";
    std::string journal_path = "polystore_journal.log";
    std::string chunk_store_dir = "polystore_chunks";
    std::string vector_index_path = "polystore_vectors.hnsw";

    static IngestOptions from_config(const Config& config) {
        IngestOptions opts;
        opts.chunk_size = config.get<uint64_t>("chunk.size", opts.chunk_size);
        opts.max_attempts = config.get<int>("upload.max_attempts", opts.max_attempts);
        opts.retry_delay = std::chrono::milliseconds(
            config.get<int64_t>("upload.retry_delay_ms", opts.retry_delay.count()));
        opts.failure_log_path = config.get<std::string>("failure_log.path", opts.failure_log_path);
        opts.journal_path = config.get<std::string>("journal.path", opts.journal_path);
        opts.chunk_store_dir = config.get<std::string>("chunk_store.dir", opts.chunk_store_dir);
        opts.vector_index_path = config.get<std::string>("vector.index_path", opts.vector_index_path);
        return opts;
    }
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "polystore.conf") {
    Config& config = Config::getInstance();

    // Honour the log level before the file is parsed so load messages obey it
    const char* log_level_env = std::getenv("PS_LOG_LEVEL");
    if (log_level_env) {
        set_log_level(parse_log_level(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace polystore

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "geohash/logging.hpp"

namespace geohash {

// Defaults and limits for the tool-level settings
constexpr int DEFAULT_HASH_LENGTH = 9;
constexpr int MAX_CONFIG_HASH_LENGTH = 22;
constexpr int DEFAULT_OUTPUT_PRECISION = 12;
constexpr int MAX_OUTPUT_PRECISION = 17;

/**
 * Key/value settings for the geohash tools.
 *
 * Values come from environment variables first, then from an optional
 * "key = value" file that overrides them. The codec library never reads
 * configuration; only the command-line front end does.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            values_.clear();
            load_from_env();
            if (!config_file.empty() && std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            }
        }
        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t consumed = 0;
                int value = std::stoi(it->second, &consumed);
                if (consumed != it->second.size()) {
                    LOG_WARN("Trailing characters in config value for key '", key, "', using default");
                    return default_value;
                }
                return value;
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.find(key) != values_.end();
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    // Checks ranges and normalises the log level; logs every problem found
    bool validate() {
        bool valid = true;

        int length = get<int>("encode.length", DEFAULT_HASH_LENGTH);
        if (length < 1 || length > MAX_CONFIG_HASH_LENGTH) {
            LOG_ERROR("Invalid encode.length: ", length, " (expected 1..", MAX_CONFIG_HASH_LENGTH, ")");
            valid = false;
        }

        int precision = get<int>("output.precision", DEFAULT_OUTPUT_PRECISION);
        if (precision < 1 || precision > MAX_OUTPUT_PRECISION) {
            LOG_ERROR("Invalid output.precision: ", precision, " (expected 1..", MAX_OUTPUT_PRECISION, ")");
            valid = false;
        }

        std::string log_level = get<std::string>("log.level", "info");
        if (!parse_log_level(log_level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("log.level", "GEOHASH_LOG_LEVEL", "info");
        set_if_env("encode.length", "GEOHASH_DEFAULT_LENGTH", std::to_string(DEFAULT_HASH_LENGTH));
        set_if_env("output.precision", "GEOHASH_OUTPUT_PRECISION", std::to_string(DEFAULT_OUTPUT_PRECISION));
    }

    void set_if_env(const std::string& key, const char* env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    static std::string trim(const std::string& s) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        auto begin = std::find_if(s.begin(), s.end(), not_space);
        auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            std::string trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

            size_t equals_pos = trimmed.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed line ", line_no, " in ", filename);
                continue;
            }

            std::string key = trim(trimmed.substr(0, equals_pos));
            std::string value = trim(trimmed.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply the configured log level
inline bool init_config(const std::string& config_file = "geohash.env") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (auto level = parse_log_level(config.get<std::string>("log.level", "info"))) {
        set_log_level(*level);
    }
    return true;
}

} // namespace geohash

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "halbrain/logging.hpp"

namespace halbrain {

// Out of 256: how often a walk keeps growing past a legal sentence boundary.
inline constexpr int DEFAULT_CONTINUE_CHANCE = 128;

struct GenerationConfig {
    int continue_chance = DEFAULT_CONTINUE_CHANCE;

    // Once a sentence reaches this many words, optional continuation past a
    // legal boundary is refused. Forced steps are unaffected. 0 = unbounded.
    size_t max_words = 0;
};

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();
        }

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
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
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
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
        auto it = values_.find(key);
        return it != values_.end() && !it->second.empty();
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    GenerationConfig generation() const {
        GenerationConfig gen;
        gen.continue_chance = get<int>("generation.continue_chance", DEFAULT_CONTINUE_CHANCE);
        int max_words = get<int>("generation.max_words", 0);
        gen.max_words = max_words > 0 ? static_cast<size_t>(max_words) : 0;
        return gen;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("brain.file", "HB_BRAIN_FILE", "halbrain.brain");

        set_if_env("log.level", "HB_LOG_LEVEL", "info");
        set_if_env("log.file", "HB_LOG_FILE", "");

        set_if_env("generation.seed", "HB_SEED", "");
        set_if_env("generation.continue_chance", "HB_CONTINUE_CHANCE", std::to_string(DEFAULT_CONTINUE_CHANCE));
        set_if_env("generation.max_words", "HB_MAX_WORDS", "0");
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

        std::lock_guard<std::mutex> lock(mutex_);
        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), [](int ch) { return !std::isspace(ch); }));
                key.erase(std::find_if(key.rbegin(), key.rend(), [](int ch) { return !std::isspace(ch); }).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](int ch) { return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](int ch) { return !std::isspace(ch); }).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        if (get<std::string>("brain.file").empty()) {
            LOG_ERROR("Brain file not configured");
            valid = false;
        }

        std::string log_level = get<std::string>("log.level");
        LogLevel parsed;
        if (!parse_log_level(log_level, parsed)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        int chance = get<int>("generation.continue_chance", DEFAULT_CONTINUE_CHANCE);
        if (chance < 0 || chance > 256) {
            LOG_WARN("generation.continue_chance must be within 0..256, got ", chance,
                     "; using ", DEFAULT_CONTINUE_CHANCE);
            set("generation.continue_chance", std::to_string(DEFAULT_CONTINUE_CHANCE));
        }

        if (get<int>("generation.max_words", 0) < 0) {
            LOG_WARN("generation.max_words must not be negative; using 0 (unbounded)");
            set("generation.max_words", "0");
        }

        std::string seed = get<std::string>("generation.seed");
        if (!seed.empty() && !std::all_of(seed.begin(), seed.end(), [](unsigned char c) { return std::isdigit(c); })) {
            LOG_WARN("generation.seed must be a non-negative integer, got '", seed, "'; ignoring");
            set("generation.seed", "");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Loads configuration and applies the logging settings it names.
inline bool init_config(const std::string& config_file = "halbrain.conf") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level;
    if (!parse_log_level(config.get<std::string>("log.level"), level)) {
        level = LogLevel::INFO;
    }
    set_log_level(level);

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded successfully");
    return true;
}

} // namespace halbrain

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Splits "a, b,,c" into {"a", "b", "c"}
    static std::set<std::string> splitList(const std::string& value, char delimiter = ',') {
        std::set<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (getline(ss, item, delimiter)) {
            item = trim(item);
            if (!item.empty()) {
                items.insert(item);
            }
        }
        return items;
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Load configuration: defaults, then the config file, then command-line arguments.
    // "config=<path>" on the command line replaces the standard file locations.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        std::vector<std::string> config_paths;
        auto config_arg = startupArguments.find("config");
        if (config_arg != startupArguments.end()) {
            config_paths.push_back(config_arg->second);
        } else {
            config_paths = {
                "cachify.config",              // Current directory
                "../cachify.config",           // Parent directory
                "/app/cachify.config",         // Docker container path
                "../../cachify.config"         // Development path
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        applyConfigEntry(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                    } else {
                        cerr << "Warning: Ignoring malformed config line: " << line << endl;
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        // Process StartUp Arguments, they override the file
        for (const auto& [key, value] : startupArguments) {
            if (key == "config") {
                continue;
            }
            applyConfigEntry(config, key, value);
        }

        return config;
    }

    // Applies one key=value setting. Bad integers and unknown keys only warn.
    static void applyConfigEntry(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else if (key == "default_cache_capacity") {
            if (auto val = parseIntSetting(key, value)) {
                config.default_cache_spec.capacity = *val;
            }
        } else if (key == "default_cache_ttl_in_millis") {
            if (auto val = parseIntSetting(key, value)) {
                config.default_cache_spec.default_ttl = std::chrono::milliseconds(*val);
            }
        } else if (key == "expiry_sweep_interval_in_millis") {
            if (auto val = parseIntSetting(key, value)) {
                config.expiry_sweep_interval_in_millis = *val;
            }
        } else if (key == "metrics_batch_size") {
            if (auto val = parseIntSetting(key, value)) {
                config.metrics_batch_size = *val;
            }
        } else if (key == "metrics_send_interval") {
            if (auto val = parseIntSetting(key, value)) {
                // value provided in millis
                config.metrics_send_interval_in_millis = *val;
            }
        } else if (key == "workload_threads") {
            if (auto val = parseIntSetting(key, value)) {
                config.workload_threads = *val;
            }
        } else if (key == "workload_requests") {
            if (auto val = parseIntSetting(key, value)) {
                config.workload_requests = *val;
            }
        } else if (key == "repository_latency_in_millis") {
            if (auto val = parseIntSetting(key, value)) {
                config.repository_latency_in_millis = *val;
            }
        } else if (key.rfind(Constants::CACHE_KEY_PREFIX, 0) == 0) {
            applyCacheSpecEntry(config, key, value);
        } else if (key.rfind(Constants::INVALIDATE_KEY_PREFIX, 0) == 0) {
            std::string trigger = key.substr(std::string(Constants::INVALIDATE_KEY_PREFIX).size());
            if (trigger.empty()) {
                cerr << "Warning: Missing trigger cache name in config key: " << key << endl;
                return;
            }
            auto dependents = splitList(value);
            config.invalidation_rules[trigger].insert(dependents.begin(), dependents.end());
        } else {
            cerr << "Warning: Unknown configuration key: " << key << endl;
        }
    }

private:
    static optional<int> parseIntSetting(const std::string& key, const std::string& value) {
        auto val = stringToInt(value);
        if (!val) {
            cerr << "Warning: Invalid integer for " << key << " in configuration: " << value << endl;
        }
        return val;
    }

    // cache.<name>.capacity / cache.<name>.ttl_in_millis
    static void applyCacheSpecEntry(AppConfig& config, const std::string& key, const std::string& value) {
        std::string rest = key.substr(std::string(Constants::CACHE_KEY_PREFIX).size());
        size_t dot = rest.rfind('.');
        if (dot == string::npos || dot == 0) {
            cerr << "Warning: Expected cache.<name>.<setting> but got: " << key << endl;
            return;
        }
        std::string name = rest.substr(0, dot);
        std::string setting = rest.substr(dot + 1);

        if (setting == "capacity") {
            if (auto val = parseIntSetting(key, value)) {
                config.cache_specs[name].capacity = *val;
            }
        } else if (setting == "ttl_in_millis") {
            if (auto val = parseIntSetting(key, value)) {
                config.cache_specs[name].default_ttl = std::chrono::milliseconds(*val);
            }
        } else {
            cerr << "Warning: Unknown cache setting '" << setting << "' for cache '" << name << "'" << endl;
        }
    }
};

#endif // UTILS_HPP

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/CacheConfig.hpp"

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

    static std::optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Accepts 1/0 and true/false
    static std::optional<bool> stringToBool(const std::string& str) {
        if (str == "1" || str == "true") return true;
        if (str == "0" || str == "false") return false;
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return str;
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                             // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,        // Parent directory
            std::string("/etc/threadcache/") + Constants::CONFIG_FILE_NAME
        };
    }

    // Applies one key=value setting. Unknown keys and bad values are
    // reported on std::cerr and leave the config unchanged.
    static void applyConfigValue(CacheConfig& config, const std::string& key, const std::string& value) {
        if (key == "namespace") {
            if (value.empty()) {
                std::cerr << "Warning: Empty namespace ignored." << std::endl;
            } else {
                config.namespace_name = value;
            }
        } else if (key == "expires_in") {
            if (value == "none") {
                config.default_expires_in = std::nullopt;
            } else if (auto val = stringToDouble(value)) {
                // value provided in seconds
                config.default_expires_in = *val;
            } else {
                std::cerr << "Warning: Invalid number for expires_in: " << value << std::endl;
            }
        } else if (key == "skip_nil") {
            if (auto val = stringToBool(value)) {
                config.default_skip_nil = *val;
            } else {
                std::cerr << "Warning: Invalid boolean for skip_nil: " << value << std::endl;
            }
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        } else {
            std::cerr << "Warning: Unknown configuration key: " << key << std::endl;
        }
    }

    // Load configuration from the first readable config file, then overrides
    static CacheConfig loadConfiguration(const std::map<std::string, std::string>& overrides = {},
                                         const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        CacheConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                config_found = true;
                std::string line;
                while (std::getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != std::string::npos && delimiterPos > 0) {
                        applyConfigValue(config,
                                         trim(line.substr(0, delimiterPos)),
                                         trim(line.substr(delimiterPos + 1)));
                    } else {
                        std::cerr << "Warning: Malformed line in " << config_path << ": '" << line << "'" << std::endl;
                    }
                }
                break;
            }
        }

        if (!config_found && !config_paths.empty()) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults." << std::endl;
        }

        for (const auto& pair : overrides) {
            applyConfigValue(config, pair.first, pair.second);
        }

        return config;
    }

    // Integer reading of a stored value for increment/decrement.
    // null -> 0, floats truncate, strings use their leading integer (0 if none).
    static std::int64_t toInteger(const nlohmann::json& value) {
        switch (value.type()) {
            case nlohmann::json::value_t::null:
                return 0;
            case nlohmann::json::value_t::number_integer:
                return value.get<std::int64_t>();
            case nlohmann::json::value_t::number_unsigned: {
                auto val = value.get<std::uint64_t>();
                if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    throw std::out_of_range("Integer value out of range: " + value.dump());
                }
                return static_cast<std::int64_t>(val);
            }
            case nlohmann::json::value_t::number_float: {
                double val = std::trunc(value.get<double>());
                if (!std::isfinite(val) ||
                    val < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
                    val >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                    throw std::out_of_range("Float value cannot be converted to an integer: " + value.dump());
                }
                return static_cast<std::int64_t>(val);
            }
            case nlohmann::json::value_t::string:
                return leadingInteger(value.get_ref<const std::string&>());
            default:
                throw std::invalid_argument(std::string("Value of type ") + value.type_name() +
                                            " cannot be converted to an integer");
        }
    }

    // "  -12_000abc" -> -12000, "abc" -> 0
    static std::int64_t leadingInteger(const std::string& str) {
        size_t pos = 0;
        while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos]))) {
            ++pos;
        }

        bool negative = false;
        if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
            negative = (str[pos] == '-');
            ++pos;
        }

        // Accumulate as a negative number so INT64_MIN fits
        std::int64_t result = 0;
        const std::int64_t min = std::numeric_limits<std::int64_t>::min();
        bool previous_was_digit = false;
        for (; pos < str.size(); ++pos) {
            char c = str[pos];
            if (c == '_' && previous_was_digit && pos + 1 < str.size() &&
                std::isdigit(static_cast<unsigned char>(str[pos + 1]))) {
                previous_was_digit = false;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                break;
            }
            int digit = c - '0';
            if (result < (min + digit) / 10) {
                throw std::out_of_range("Integer value out of range: " + str);
            }
            result = result * 10 - digit;
            previous_was_digit = true;
        }

        if (negative) {
            return result;
        }
        if (result == min) {
            throw std::out_of_range("Integer value out of range: " + str);
        }
        return -result;
    }

    static std::int64_t checkedAdd(std::int64_t lhs, std::int64_t rhs) {
        const std::int64_t max = std::numeric_limits<std::int64_t>::max();
        const std::int64_t min = std::numeric_limits<std::int64_t>::min();
        if ((rhs > 0 && lhs > max - rhs) || (rhs < 0 && lhs < min - rhs)) {
            throw std::out_of_range("Integer overflow: " + std::to_string(lhs) + " + " + std::to_string(rhs));
        }
        return lhs + rhs;
    }

    static std::int64_t checkedSubtract(std::int64_t lhs, std::int64_t rhs) {
        const std::int64_t max = std::numeric_limits<std::int64_t>::max();
        const std::int64_t min = std::numeric_limits<std::int64_t>::min();
        if ((rhs < 0 && lhs > max + rhs) || (rhs > 0 && lhs < min + rhs)) {
            throw std::out_of_range("Integer overflow: " + std::to_string(lhs) + " - " + std::to_string(rhs));
        }
        return lhs - rhs;
    }
};

#endif // UTILS_HPP

#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// Counter names reported through IStatsDClient.
namespace MetricsDefinitions {
    static std::string CACHE_HIT = "thread_cache.hit";

    static std::string CACHE_MISS = "thread_cache.miss";

    static std::string CACHE_WRITE = "thread_cache.write";

    // Expired or version-mismatched entries deleted on access or cleanup
    static std::string CACHE_INVALIDATED = "thread_cache.invalidated";

    // Entries left in the calling thread's mapping after a cleanup sweep
    static std::string CACHE_SIZE = "thread_cache.size";
}

namespace Constants {
    static constexpr auto DEFAULT_NAMESPACE = "thread_cache";
    static constexpr double DEFAULT_EXPIRES_IN_SECONDS = 60.0;
    static constexpr auto CONFIG_FILE_NAME = "threadcache.config";
    // Pass as a per-call expires_in to store an entry without expiry
    static constexpr double NEVER_EXPIRES = std::numeric_limits<double>::infinity();
};

// --- Configuration Struct ---
class CacheConfig {
public:
    // Name of the per-thread mapping this cache reads and writes
    std::string namespace_name;

    // Applied when a call does not give expires_in. nullopt: entries never expire.
    std::optional<double> default_expires_in;

    // Applied when a call does not give skip_nil
    bool default_skip_nil;

    // Level for the default ConsoleLogger. That logger is process-wide, so only
    // the first cache built without an explicit logger sets it.
    LogUtils::LogLevel log_level;

    CacheConfig() {
        // --- Set Defaults  ---
        namespace_name = Constants::DEFAULT_NAMESPACE;
        default_expires_in = Constants::DEFAULT_EXPIRES_IN_SECONDS;
        default_skip_nil = false;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "namespace: " << namespace_name << std::endl
            << "default_expires_in: ";
        if (default_expires_in) {
            ss << *default_expires_in;
        } else {
            ss << "none";
        }
        ss << std::endl
            << "default_skip_nil: " << std::boolalpha << default_skip_nil << std::noboolalpha << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP

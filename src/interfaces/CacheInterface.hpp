#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "../models/CacheOptions.hpp"

// Minimal key-value surface. A null json from get() means "no valid value".
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    virtual nlohmann::json set(const std::string& key, const nlohmann::json& value, const CacheOptions& options = {}) = 0;
    virtual nlohmann::json get(const std::string& key, const CacheOptions& options = {}) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool clear() = 0;
    virtual bool exists(const std::string& key) = 0;
};

#endif // CACHEINTERFACE_HPP

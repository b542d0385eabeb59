#pragma once

#include <optional>

#include <nlohmann/json.hpp>

// --- A stored value plus the metadata used to validate it ---
struct CacheEntry {
    nlohmann::json value;                // Stored as given, may be null
    nlohmann::json version;              // null: unversioned
    std::optional<double> expires_in;    // Seconds after created_at; nullopt: never expires
    double created_at = 0.0;             // Unix time in seconds

    // Expired once created_at + expires_in has been reached
    bool isExpired(double now) const {
        return expires_in.has_value() && created_at + *expires_in <= now;
    }

    // Both versions must be present to mismatch
    bool isMismatched(const nlohmann::json& requested_version) const {
        return !version.is_null() && !requested_version.is_null() && version != requested_version;
    }

    bool operator==(const CacheEntry& other) const {
        return value == other.value && version == other.version &&
               expires_in == other.expires_in && created_at == other.created_at;
    }
};

#include <cmath>
#include <sstream>

#include "ThreadCache.hpp"
#include "../core/SystemClock.hpp"
#include "../core/ThreadLocalStore.hpp"
#include "../logging/ConsoleLogger.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../utils/Utils.hpp"

ThreadCache::ThreadCache(const CacheConfig& config,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client,
                         std::shared_ptr<IClock> clock)
    : config_(config),
      logger_(logger ? std::move(logger) : ConsoleLogger::getInstance(config.log_level)),
      statsd_client_(statsd_client ? std::move(statsd_client) : DummyStatsDClient::getInstance()),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    // Registers the namespace on the constructing thread; existing entries are kept
    dataStore();

    if (logger_->isDebugEnabled()) {
        logger_->debug("ThreadCache created.\n" + config_.to_string());
    }
}

EntryStore& ThreadCache::dataStore() const {
    return get_thread_data_store(config_.namespace_name);
}

ThreadCache::ResolvedOptions ThreadCache::resolve(const CacheOptions& options) const {
    ResolvedOptions resolved;
    resolved.force = options.force;
    resolved.version = options.version;
    if (options.expires_in) {
        if (std::isinf(*options.expires_in) && *options.expires_in > 0) {
            resolved.expires_in = std::nullopt;
        } else {
            resolved.expires_in = options.expires_in;
        }
    } else {
        resolved.expires_in = config_.default_expires_in;
    }
    resolved.skip_nil = options.skip_nil.value_or(config_.default_skip_nil);
    return resolved;
}

// --- CacheInterface ---

json ThreadCache::set(const std::string& key, const json& value, const CacheOptions& options) {
    return write(key, value, options);
}

json ThreadCache::get(const std::string& key, const CacheOptions& options) {
    return read(key, options);
}

bool ThreadCache::remove(const std::string& key) {
    return dataStore().erase(key);
}

bool ThreadCache::clear() {
    dataStore().clear();
    return true;
}

bool ThreadCache::exists(const std::string& key) {
    return dataStore().contains(key);
}

// --- Single-key operations ---

json ThreadCache::write(const std::string& key, const json& value, const CacheOptions& options) {
    return performWrite(key, value, resolve(options));
}

json ThreadCache::read(const std::string& key, const CacheOptions& options) {
    Lookup lookup = validate(dataStore(), key, options.version);
    recordLookup(lookup.status);
    return lookup.value;
}

json ThreadCache::fetch(const std::string& key, const CacheOptions& options, const Producer& producer) {
    return performFetch(key, resolve(options), producer);
}

json ThreadCache::fetch(const std::string& key, const Producer& producer) {
    return fetch(key, CacheOptions(), producer);
}

std::int64_t ThreadCache::increment(const std::string& key, std::int64_t amount, const CacheOptions& options) {
    return performAdd(key, amount, false, resolve(options));
}

std::int64_t ThreadCache::decrement(const std::string& key, std::int64_t amount, const CacheOptions& options) {
    return performAdd(key, amount, true, resolve(options));
}

// --- Batch operations ---

ThreadCache::KeyValueList ThreadCache::writeMulti(const KeyValueList& keys_and_values,
                                                  const MultiCacheOptions& options) {
    std::vector<std::string> keys;
    keys.reserve(keys_and_values.size());
    for (const auto& pair : keys_and_values) {
        keys.push_back(pair.first);
    }

    for (size_t i = 0; i < keys_and_values.size(); ++i) {
        performWrite(keys_and_values[i].first, keys_and_values[i].second, resolve(options.forKey(keys, i)));
    }
    return keys_and_values;
}

std::map<std::string, json> ThreadCache::readMulti(const std::vector<std::string>& keys,
                                                   const MultiCacheOptions& options) {
    std::map<std::string, json> result;
    EntryStore& store = dataStore();
    for (size_t i = 0; i < keys.size(); ++i) {
        Lookup lookup = validate(store, keys[i], resolve(options.forKey(keys, i)).version);
        recordLookup(lookup.status);
        result[keys[i]] = std::move(lookup.value);
    }
    return result;
}

std::map<std::string, json> ThreadCache::fetchMulti(const std::vector<std::string>& keys,
                                                    const MultiCacheOptions& options,
                                                    const Producer& producer) {
    std::map<std::string, json> result;
    for (size_t i = 0; i < keys.size(); ++i) {
        result[keys[i]] = performFetch(keys[i], resolve(options.forKey(keys, i)), producer);
    }
    return result;
}

std::map<std::string, json> ThreadCache::fetchMulti(const std::vector<std::string>& keys,
                                                    const Producer& producer) {
    return fetchMulti(keys, MultiCacheOptions(), producer);
}

std::vector<bool> ThreadCache::removeMulti(const std::vector<std::string>& keys) {
    std::vector<bool> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(remove(key));
    }
    return result;
}

std::vector<std::string> ThreadCache::removeMatched(const std::regex& pattern) {
    EntryStore& store = dataStore();
    std::vector<std::string> removed;
    for (const auto& key : store.keys()) {
        if (std::regex_search(key, pattern)) {
            store.erase(key);
            removed.push_back(key);
        }
    }
    return removed;
}

std::vector<std::string> ThreadCache::removeMatched(const std::string& pattern) {
    return removeMatched(std::regex(pattern));
}

std::vector<std::string> ThreadCache::cleanup(const CacheOptions& options) {
    EntryStore& store = dataStore();
    std::vector<std::string> removed;
    for (const auto& key : store.keys()) {
        if (validate(store, key, options.version).status == EntryStatus::Invalid) {
            removed.push_back(key);
        }
    }

    statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(store.size()));
    if (logger_->isDebugEnabled()) {
        std::stringstream ss;
        ss << "Cleanup of namespace '" << config_.namespace_name << "' removed " << removed.size()
           << " entries, " << store.size() << " left.";
        logger_->debug(ss.str());
    }
    return removed;
}

// --- Internals ---

ThreadCache::Lookup ThreadCache::validate(EntryStore& store, const std::string& key, const json& version) {
    const CacheEntry* entry = store.find(key);
    if (entry == nullptr) {
        return {EntryStatus::NotFound, json()};
    }

    bool expired = entry->isExpired(clock_->now());
    if (expired || entry->isMismatched(version)) {
        if (logger_->isDebugEnabled()) {
            // Versions may hold arbitrary bytes; replace invalid UTF-8 rather than throw
            std::string reason = expired
                ? std::string("expired")
                : "has version " + entry->version.dump(-1, ' ', false, json::error_handler_t::replace) +
                      ", requested " + version.dump(-1, ' ', false, json::error_handler_t::replace);
            logger_->debug("Entry '" + key + "' " + reason + ". Deleting.");
        }
        store.erase(key);
        statsd_client_->increment(MetricsDefinitions::CACHE_INVALIDATED);
        return {EntryStatus::Invalid, json()};
    }

    return {EntryStatus::Valid, entry->value};
}

void ThreadCache::recordLookup(EntryStatus status) {
    if (status == EntryStatus::Valid) {
        statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
    } else {
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
    }
}

json ThreadCache::performWrite(const std::string& key, const json& value, const ResolvedOptions& options) {
    if (value.is_null() && options.skip_nil) {
        if (logger_->isDebugEnabled()) {
            logger_->debug("Skipping null value for '" + key + "'.");
        }
        return value;
    }

    CacheEntry entry;
    entry.value = value;
    entry.version = options.version;
    entry.expires_in = options.expires_in;
    entry.created_at = clock_->now();

    dataStore().put(key, std::move(entry));
    statsd_client_->increment(MetricsDefinitions::CACHE_WRITE);
    return value;
}

json ThreadCache::performFetch(const std::string& key, const ResolvedOptions& options, const Producer& producer) {
    if (!options.force) {
        Lookup lookup = validate(dataStore(), key, options.version);
        recordLookup(lookup.status);
        if (lookup.status == EntryStatus::Valid) {
            return lookup.value;
        }
    }

    // The producer may touch this cache, so no store reference is held across it
    return performWrite(key, producer(key), options);
}

std::int64_t ThreadCache::performAdd(const std::string& key, std::int64_t amount, bool subtract,
                                     const ResolvedOptions& options) {
    Lookup lookup = validate(dataStore(), key, options.version);
    std::int64_t current = Utils::toInteger(lookup.value);
    std::int64_t value = subtract ? Utils::checkedSubtract(current, amount) : Utils::checkedAdd(current, amount);
    performWrite(key, value, options);
    return value;
}

#ifndef THREADCACHE_HPP
#define THREADCACHE_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/CacheConfig.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/CacheOptions.hpp"
#include "EntryStore.hpp"

using json = nlohmann::json;

/*
 * Key-value cache whose entries live in the calling thread's storage.
 *
 * Every operation works on the EntryStore registered for this cache's
 * namespace on the current thread, so one instance can be shared between
 * threads while each thread only ever sees its own entries. Entries expire
 * lazily: an expired or version-mismatched entry is deleted when a read,
 * fetch, increment/decrement or cleanup comes across it.
 */
class ThreadCache : public CacheInterface {
public:
    using Producer = std::function<json(const std::string& key)>;
    using KeyValueList = std::vector<std::pair<std::string, json>>;

    // Null collaborators fall back to ConsoleLogger, DummyStatsDClient and SystemClock
    explicit ThreadCache(const CacheConfig& config = CacheConfig(),
                         std::shared_ptr<ILogger> logger = nullptr,
                         std::shared_ptr<IStatsDClient> statsd_client = nullptr,
                         std::shared_ptr<IClock> clock = nullptr);

    ~ThreadCache() override = default;

    // --- CacheInterface ---
    json set(const std::string& key, const json& value, const CacheOptions& options = {}) override;
    json get(const std::string& key, const CacheOptions& options = {}) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    // True if an entry is stored, valid or not
    bool exists(const std::string& key) override;

    // Stores value unless it is null and skip_nil applies. Returns value.
    json write(const std::string& key, const json& value, const CacheOptions& options = {});

    // Valid value for key, or null. Invalid entries are deleted.
    json read(const std::string& key, const CacheOptions& options = {});

    // Valid value for key; otherwise (or when forced) writes and returns producer(key)
    json fetch(const std::string& key, const CacheOptions& options, const Producer& producer);
    json fetch(const std::string& key, const Producer& producer);

    KeyValueList writeMulti(const KeyValueList& keys_and_values, const MultiCacheOptions& options = {});
    std::map<std::string, json> readMulti(const std::vector<std::string>& keys, const MultiCacheOptions& options = {});
    std::map<std::string, json> fetchMulti(const std::vector<std::string>& keys, const MultiCacheOptions& options,
                                           const Producer& producer);
    std::map<std::string, json> fetchMulti(const std::vector<std::string>& keys, const Producer& producer);

    // One result per key, in order
    std::vector<bool> removeMulti(const std::vector<std::string>& keys);

    // Deletes keys in which pattern finds a match. Returns them in insertion order.
    std::vector<std::string> removeMatched(const std::regex& pattern);
    std::vector<std::string> removeMatched(const std::string& pattern);

    // Deletes every entry invalid for options.version. Returns the deleted keys.
    std::vector<std::string> cleanup(const CacheOptions& options = {});

    // Missing or invalid entries count as 0. The result is written back with options.
    std::int64_t increment(const std::string& key, std::int64_t amount = 1, const CacheOptions& options = {});
    std::int64_t decrement(const std::string& key, std::int64_t amount = 1, const CacheOptions& options = {});

    const CacheConfig& config() const { return config_; }

private:
    enum class EntryStatus { Valid, NotFound, Invalid };

    struct Lookup {
        EntryStatus status;
        json value;
    };

    // CacheOptions with the defaults filled in
    struct ResolvedOptions {
        bool force;
        json version;
        std::optional<double> expires_in;
        bool skip_nil;
    };

    EntryStore& dataStore() const;
    ResolvedOptions resolve(const CacheOptions& options) const;

    Lookup validate(EntryStore& store, const std::string& key, const json& version);
    void recordLookup(EntryStatus status);

    json performWrite(const std::string& key, const json& value, const ResolvedOptions& options);
    json performFetch(const std::string& key, const ResolvedOptions& options, const Producer& producer);
    std::int64_t performAdd(const std::string& key, std::int64_t amount, bool subtract,
                            const ResolvedOptions& options);

    const CacheConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
};

#endif // THREADCACHE_HPP

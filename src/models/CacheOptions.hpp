#ifndef CACHEOPTIONS_HPP
#define CACHEOPTIONS_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// --- Per-call options. Unset fields take the cache defaults. ---
struct CacheOptions {
    bool force = false;                    // fetch: recompute even on a valid hit
    nlohmann::json version;                // Written with the entry / validated against on read
    std::optional<double> expires_in;      // Constants::NEVER_EXPIRES stores no expiry
    std::optional<bool> skip_nil;
};

// An option for a batch call: unset, one value for every key, values by
// key position, or values by key. Keys a sequence or mapping does not
// cover resolve to nullopt, i.e. the cache default.
template <typename T>
class MultiOption {
public:
    MultiOption() = default;

    static MultiOption all(T value) {
        MultiOption option;
        option.source_.template emplace<1>(std::move(value));
        return option;
    }

    static MultiOption ordered(std::vector<T> values) {
        MultiOption option;
        option.source_.template emplace<2>(std::move(values));
        return option;
    }

    static MultiOption byKey(std::map<std::string, T> values) {
        MultiOption option;
        option.source_.template emplace<3>(std::move(values));
        return option;
    }

    bool isSet() const { return source_.index() != 0; }

    // Value for keys[index]
    std::optional<T> resolve(const std::vector<std::string>& keys, size_t index) const {
        // Indexed access: json converts implicitly to the container types
        if (const T* shared = std::get_if<1>(&source_)) {
            return *shared;
        }
        if (const auto* values = std::get_if<2>(&source_)) {
            if (index < values->size()) {
                return (*values)[index];
            }
            return std::nullopt;
        }
        if (const auto* values = std::get_if<3>(&source_)) {
            if (index < keys.size()) {
                auto it = values->find(keys[index]);
                if (it != values->end()) {
                    return it->second;
                }
            }
        }
        return std::nullopt;
    }

private:
    std::variant<std::monostate, T, std::vector<T>, std::map<std::string, T>> source_;
};

struct MultiCacheOptions {
    MultiOption<bool> force;
    MultiOption<nlohmann::json> version;
    MultiOption<double> expires_in;
    MultiOption<bool> skip_nil;

    // Per-key view, in the same shape single-key calls take
    CacheOptions forKey(const std::vector<std::string>& keys, size_t index) const {
        CacheOptions options;
        options.force = force.resolve(keys, index).value_or(false);
        if (auto v = version.resolve(keys, index)) {
            options.version = std::move(*v);
        }
        options.expires_in = expires_in.resolve(keys, index);
        options.skip_nil = skip_nil.resolve(keys, index);
        return options;
    }
};

#endif // CACHEOPTIONS_HPP

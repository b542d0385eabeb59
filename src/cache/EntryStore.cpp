#include <iterator>

#include "EntryStore.hpp"

CacheEntry* EntryStore::find(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &it->second->second;
}

const CacheEntry* EntryStore::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &it->second->second;
}

void EntryStore::put(const std::string& key, CacheEntry entry) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        // Existing key: replace in place, order unchanged
        it->second->second = std::move(entry);
        return;
    }

    entries_.emplace_back(key, std::move(entry));
    index_[key] = std::prev(entries_.end());
}

bool EntryStore::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

bool EntryStore::contains(const std::string& key) const {
    return index_.find(key) != index_.end();
}

void EntryStore::clear() {
    entries_.clear();
    index_.clear();
}

std::vector<std::string> EntryStore::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.push_back(item.first);
    }
    return result;
}

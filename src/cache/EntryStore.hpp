#ifndef ENTRYSTORE_HPP
#define ENTRYSTORE_HPP

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../models/CacheEntry.hpp"

// Key -> CacheEntry map that iterates in key insertion order. Overwriting a
// key keeps its position. Not synchronized: each instance belongs to one thread.
class EntryStore {
private:
    std::list<std::pair<std::string, CacheEntry>> entries_;    // Insertion order (front=oldest)
    std::unordered_map<std::string, std::list<std::pair<std::string, CacheEntry>>::iterator> index_;

public:
    EntryStore() = default;

    // Copies would alias list iterators held in index_
    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;
    EntryStore(EntryStore&&) = default;
    EntryStore& operator=(EntryStore&&) = default;

    // nullptr when the key is absent. Valid until the key is erased.
    CacheEntry* find(const std::string& key);
    const CacheEntry* find(const std::string& key) const;

    void put(const std::string& key, CacheEntry entry);
    bool erase(const std::string& key);
    bool contains(const std::string& key) const;
    void clear();

    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }

    // Snapshot of the keys in insertion order
    std::vector<std::string> keys() const;
};

#endif // ENTRYSTORE_HPP

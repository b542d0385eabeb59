#include <unordered_map>

#include "ThreadLocalStore.hpp"

// Node-based map: references to stores survive inserting other namespaces
thread_local std::unordered_map<std::string, EntryStore> thread_data_stores;

EntryStore& get_thread_data_store(const std::string& namespace_name) {
    return thread_data_stores[namespace_name];
}

bool has_thread_data_store(const std::string& namespace_name) {
    return thread_data_stores.find(namespace_name) != thread_data_stores.end();
}

void reset_thread_data_store(const std::string& namespace_name) {
    thread_data_stores.erase(namespace_name);
}

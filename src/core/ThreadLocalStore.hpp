#ifndef THREADLOCALSTORE_HPP
#define THREADLOCALSTORE_HPP

#include <string>

#include "../cache/EntryStore.hpp"

// Accessors for the calling thread's entry stores, one per namespace.
// Every thread sees its own registry; stores die with their thread.

// Creates an empty store on first use. The reference stays valid until
// reset_thread_data_store(namespace_name) runs on this thread.
EntryStore& get_thread_data_store(const std::string& namespace_name);
bool has_thread_data_store(const std::string& namespace_name);
void reset_thread_data_store(const std::string& namespace_name);

#endif // THREADLOCALSTORE_HPP

#pragma once

#include <string>

// Counter/gauge sink for cache activity. Implementations must tolerate calls
// from any thread. ThreadCache only emits increment and gauge; decrement is
// there for other callers sharing the client.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void decrement(const std::string& key, int value = 1) = 0;
    virtual void gauge(const std::string& key, double value) = 0;
};

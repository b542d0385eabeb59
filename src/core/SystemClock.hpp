#pragma once

#include "../interfaces/IClock.hpp"

// Wall clock backed by std::chrono::system_clock
class SystemClock : public IClock {
public:
    ~SystemClock() override = default;
    double now() override;
};

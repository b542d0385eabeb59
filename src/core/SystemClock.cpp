#include <chrono>

#include "SystemClock.hpp"

double SystemClock::now() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

#pragma once

// Source of wall-clock time for entry creation and expiry checks.
class IClock {
public:
    virtual ~IClock() = default;

    // Seconds since the unix epoch, with sub-second precision
    virtual double now() = 0;
};

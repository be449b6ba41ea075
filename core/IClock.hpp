#pragma once

#include <chrono>
#include <string>

namespace devsim {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    /// Local wall-clock time for console lines, "YYYY-MM-DD HH:MM:SS"
    virtual std::string localTimestamp() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    std::string localTimestamp() const override;
};

} // namespace devsim

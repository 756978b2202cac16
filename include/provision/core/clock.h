#pragma once

#include <memory>

#include <provision/core/types.h>

namespace provision {

/**
 * @brief Time source used by the installer.
 *
 * Wall time stamps the start of an attempt; the monotonic reading measures
 * elapsed time so reported durations never go backwards.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
    virtual MonotonicTimePoint monotonicNow() const = 0;
};

class SystemClock final : public IClock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
    MonotonicTimePoint monotonicNow() const override { return std::chrono::steady_clock::now(); }
};

inline std::shared_ptr<IClock> makeSystemClock() {
    return std::make_shared<SystemClock>();
}

} // namespace provision

#ifndef STEADYCLOCK_HPP
#define STEADYCLOCK_HPP

#include <memory>
#include <mutex>

#include "../interfaces/IClock.hpp"

// Default time source for FlightCache, backed by std::chrono::steady_clock.
class SteadyClock : public IClock {
public:
    static std::shared_ptr<SteadyClock> getInstance();
    ~SteadyClock() override = default;

    time_point now() const override;

private:
    SteadyClock() = default;

    static std::shared_ptr<SteadyClock> instance;
    static std::once_flag init_flag;

    SteadyClock(const SteadyClock&) = delete;
    SteadyClock& operator=(const SteadyClock&) = delete;
    SteadyClock(SteadyClock&&) = delete;
    SteadyClock& operator=(SteadyClock&&) = delete;
};

#endif // STEADYCLOCK_HPP

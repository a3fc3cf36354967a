#ifndef CLOCK_SOURCE_HPP
#define CLOCK_SOURCE_HPP

#include <chrono>

namespace IntradayTrader {
namespace Core {

/**
 * @brief Supplies the current UTC instant and the blocking sleep used by every backoff.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds sleep_duration) = 0;
};

class SystemClockSource : public ClockSource {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds sleep_duration) override;
};

} // namespace Core
} // namespace IntradayTrader

#endif // CLOCK_SOURCE_HPP

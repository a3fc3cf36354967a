#ifndef MANUAL_CLOCK_SOURCE_HPP
#define MANUAL_CLOCK_SOURCE_HPP

#include <chrono>
#include <vector>
#include "utils/clock_source.hpp"

namespace IntradayTrader {
namespace Tests {

// Clock that only moves when told to or when something sleeps on it
class ManualClockSource : public Core::ClockSource {
public:
    explicit ManualClockSource(std::chrono::system_clock::time_point start_time) : current_time(start_time) {}

    std::chrono::system_clock::time_point now() const override { return current_time; }

    void sleep_for(std::chrono::milliseconds sleep_duration) override {
        recorded_sleeps.push_back(sleep_duration);
        current_time += sleep_duration;
    }

    void advance(std::chrono::milliseconds advance_duration) { current_time += advance_duration; }
    void set_time(std::chrono::system_clock::time_point new_time) { current_time = new_time; }

    const std::vector<std::chrono::milliseconds>& get_recorded_sleeps() const { return recorded_sleeps; }

private:
    std::chrono::system_clock::time_point current_time;
    std::vector<std::chrono::milliseconds> recorded_sleeps;
};

} // namespace Tests
} // namespace IntradayTrader

#endif // MANUAL_CLOCK_SOURCE_HPP

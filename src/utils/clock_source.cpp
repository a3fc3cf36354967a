#include "clock_source.hpp"
#include <thread>

namespace IntradayTrader {
namespace Core {

std::chrono::system_clock::time_point SystemClockSource::now() const {
    return std::chrono::system_clock::now();
}

void SystemClockSource::sleep_for(std::chrono::milliseconds sleep_duration) {
    if (sleep_duration.count() > 0) {
        std::this_thread::sleep_for(sleep_duration);
    }
}

} // namespace Core
} // namespace IntradayTrader

#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace IntradayTrader {
namespace Core {

namespace {

const double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();

} // anonymous namespace

std::vector<double> extract_closes(const BarTable& bars) {
    std::vector<double> close_values;
    close_values.reserve(bars.size());
    for (const Bar& bar : bars) {
        close_values.push_back(bar.close_price);
    }
    return close_values;
}

std::vector<double> calculate_sma_series(const std::vector<double>& values, int period) {
    std::vector<double> sma_values(values.size(), NOT_A_NUMBER);
    if (period <= 0) {
        return sma_values;
    }

    // NaN inputs reset the window so warm-up gaps never leak into the average
    double window_sum = 0.0;
    int valid_count = 0;
    for (size_t value_index = 0; value_index < values.size(); ++value_index) {
        if (std::isnan(values[value_index])) {
            window_sum = 0.0;
            valid_count = 0;
            continue;
        }
        window_sum += values[value_index];
        ++valid_count;
        if (valid_count > period) {
            window_sum -= values[value_index - period];
            valid_count = period;
        }
        if (valid_count == period) {
            sma_values[value_index] = window_sum / period;
        }
    }
    return sma_values;
}

std::vector<double> calculate_momentum_series(const std::vector<double>& closes, int period) {
    std::vector<double> momentum_values(closes.size(), NOT_A_NUMBER);
    if (period <= 0) {
        return momentum_values;
    }
    for (size_t close_index = static_cast<size_t>(period); close_index < closes.size(); ++close_index) {
        double reference_close = closes[close_index - period];
        if (reference_close != 0.0) {
            momentum_values[close_index] = 100.0 * closes[close_index] / reference_close;
        }
    }
    return momentum_values;
}

double calculate_williams_r(const BarTable& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period)) {
        return NOT_A_NUMBER;
    }

    double highest_high = bars[bars.size() - period].high_price;
    double lowest_low = bars[bars.size() - period].low_price;
    for (size_t bar_index = bars.size() - period; bar_index < bars.size(); ++bar_index) {
        highest_high = std::max(highest_high, bars[bar_index].high_price);
        lowest_low = std::min(lowest_low, bars[bar_index].low_price);
    }

    double price_range = highest_high - lowest_low;
    if (price_range <= 0.0) {
        return -50.0;
    }
    return -100.0 * (highest_high - bars.back().close_price) / price_range;
}

int detect_crossover(const std::vector<double>& first_series, const std::vector<double>& second_series) {
    if (first_series.size() < 2 || first_series.size() != second_series.size()) {
        return 0;
    }

    size_t last_index = first_series.size() - 1;
    double previous_difference = first_series[last_index - 1] - second_series[last_index - 1];
    double current_difference = first_series[last_index] - second_series[last_index];
    if (std::isnan(previous_difference) || std::isnan(current_difference)) {
        return 0;
    }

    if (previous_difference < 0.0 && current_difference > 0.0) {
        return 1;
    }
    if (previous_difference > 0.0 && current_difference < 0.0) {
        return -1;
    }
    return 0;
}

} // namespace Core
} // namespace IntradayTrader

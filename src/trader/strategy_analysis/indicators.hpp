#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Core {

// Series helpers; every returned vector is aligned with the input (NaN until warmed up)
std::vector<double> extract_closes(const BarTable& bars);
std::vector<double> calculate_sma_series(const std::vector<double>& values, int period);
std::vector<double> calculate_momentum_series(const std::vector<double>& closes, int period);

// Williams %R of the last bar, NaN when fewer than period bars are available
double calculate_williams_r(const BarTable& bars, int period);

// +1 when first crossed above second on the last bar, -1 when it crossed below, 0 otherwise
int detect_crossover(const std::vector<double>& first_series, const std::vector<double>& second_series);

} // namespace Core
} // namespace IntradayTrader

#endif // INDICATORS_HPP

// OrdersConfig.hpp
#ifndef ORDERS_CONFIG_HPP
#define ORDERS_CONFIG_HPP

#include <string>
#include <vector>

struct OrdersConfig {
    // Instruments the loop trades and liquidates at end of day (SYMBOL-CURRENCY-TRADETYPE)
    std::vector<std::string> tracked_instruments;
};

#endif // ORDERS_CONFIG_HPP

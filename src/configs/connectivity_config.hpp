// ConnectivityConfig.hpp
#ifndef CONNECTIVITY_CONFIG_HPP
#define CONNECTIVITY_CONFIG_HPP

// Health policy for one upstream channel (market data or broker)
struct ConnectivityPolicy {
    int degraded_after_failures = 3;                 // Consecutive failures before DEGRADED
    int disconnected_after_failures = 6;             // Consecutive failures before DISCONNECTED
    int initial_backoff_seconds = 1;                 // Hold-off after the first failure
    int max_backoff_seconds = 60;                    // Upper bound for the hold-off
    double backoff_multiplier = 2.0;                 // Growth per further failure
};

#endif // CONNECTIVITY_CONFIG_HPP

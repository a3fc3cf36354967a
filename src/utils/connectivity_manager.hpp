#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <chrono>
#include <mutex>
#include <string>
#include "configs/connectivity_config.hpp"
#include "utils/clock_source.hpp"

/**
 * ConnectivityManager - Health of one upstream channel.
 *
 * The market data provider and the broker each own a channel, so a provider outage
 * never holds back broker requests. Consecutive transport failures move the channel
 * CONNECTED -> DEGRADED -> DISCONNECTED. Once the channel is no longer CONNECTED,
 * requests are refused until the current backoff window has passed. One success
 * restores CONNECTED.
 */
class ConnectivityManager {
public:
    enum class ChannelStatus {
        CONNECTED,
        DEGRADED,
        DISCONNECTED
    };

    struct ChannelSnapshot {
        ChannelStatus status = ChannelStatus::CONNECTED;
        int consecutive_failures = 0;
        int backoff_seconds = 0;
        std::chrono::system_clock::time_point retry_not_before;
        std::string last_error_message;
    };

    // Throws SetupError when the policy thresholds or backoff are inconsistent
    ConnectivityManager(std::string channel_name_param, const ConnectivityPolicy& policy_param,
                        IntradayTrader::Core::ClockSource& clock_source_ref);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    void record_success();
    void record_failure(const std::string& error_message);

    // False while a non-connected channel is inside its backoff window
    bool allows_request() const;
    long long get_seconds_until_retry() const;

    ChannelStatus get_status() const;
    ChannelSnapshot get_snapshot() const;
    const std::string& get_channel_name() const;
    std::string describe() const;

private:
    std::string channel_name;
    ConnectivityPolicy policy;
    IntradayTrader::Core::ClockSource& clock_source;
    mutable std::mutex channel_mutex;
    ChannelSnapshot channel_state;

    int next_backoff_seconds() const;
};

std::string to_string(ConnectivityManager::ChannelStatus channel_status);

#endif // CONNECTIVITY_MANAGER_HPP

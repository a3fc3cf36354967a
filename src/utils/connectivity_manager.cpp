#include "connectivity_manager.hpp"
#include <algorithm>
#include <cmath>
#include "logging/logger/async_logger.hpp"
#include "trader/errors/trading_errors.hpp"

using IntradayTrader::Logging::log_message;

ConnectivityManager::ConnectivityManager(std::string channel_name_param, const ConnectivityPolicy& policy_param,
                                         IntradayTrader::Core::ClockSource& clock_source_ref)
    : channel_name(std::move(channel_name_param)), policy(policy_param), clock_source(clock_source_ref) {
    if (policy.degraded_after_failures <= 0) {
        throw IntradayTrader::Core::SetupError(channel_name + " connectivity: degraded_after_failures must be > 0");
    }
    if (policy.disconnected_after_failures <= policy.degraded_after_failures) {
        throw IntradayTrader::Core::SetupError(channel_name + " connectivity: disconnected_after_failures must exceed degraded_after_failures");
    }
    if (policy.initial_backoff_seconds <= 0 || policy.max_backoff_seconds < policy.initial_backoff_seconds) {
        throw IntradayTrader::Core::SetupError(channel_name + " connectivity: backoff must satisfy 0 < initial <= max");
    }
    if (policy.backoff_multiplier < 1.0) {
        throw IntradayTrader::Core::SetupError(channel_name + " connectivity: backoff_multiplier must be >= 1.0");
    }
    channel_state.retry_not_before = clock_source.now();
}

void ConnectivityManager::record_success() {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    if (channel_state.status != ChannelStatus::CONNECTED) {
        log_message("Connectivity: " + channel_name + " recovered after " +
                    std::to_string(channel_state.consecutive_failures) + " failures", "");
    }
    channel_state = ChannelSnapshot();
    channel_state.retry_not_before = clock_source.now();
}

void ConnectivityManager::record_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    ChannelStatus previous_status = channel_state.status;

    channel_state.consecutive_failures++;
    channel_state.last_error_message = error_message;
    channel_state.backoff_seconds = next_backoff_seconds();
    channel_state.retry_not_before = clock_source.now() + std::chrono::seconds(channel_state.backoff_seconds);

    if (channel_state.consecutive_failures >= policy.disconnected_after_failures) {
        channel_state.status = ChannelStatus::DISCONNECTED;
    } else if (channel_state.consecutive_failures >= policy.degraded_after_failures) {
        channel_state.status = ChannelStatus::DEGRADED;
    }

    if (channel_state.status != previous_status) {
        log_message("WARNING: Connectivity: " + channel_name + " is " + to_string(channel_state.status) + " after " +
                    std::to_string(channel_state.consecutive_failures) + " failures, backing off " +
                    std::to_string(channel_state.backoff_seconds) + "s (" + error_message + ")", "");
    }
}

bool ConnectivityManager::allows_request() const {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    if (channel_state.status == ChannelStatus::CONNECTED) {
        return true;
    }
    return clock_source.now() >= channel_state.retry_not_before;
}

long long ConnectivityManager::get_seconds_until_retry() const {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    auto remaining = channel_state.retry_not_before - clock_source.now();
    if (remaining <= std::chrono::system_clock::duration::zero()) {
        return 0;
    }
    // Partial seconds round up
    return static_cast<long long>(std::ceil(std::chrono::duration<double>(remaining).count()));
}

ConnectivityManager::ChannelStatus ConnectivityManager::get_status() const {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    return channel_state.status;
}

ConnectivityManager::ChannelSnapshot ConnectivityManager::get_snapshot() const {
    std::lock_guard<std::mutex> state_lock(channel_mutex);
    return channel_state;
}

const std::string& ConnectivityManager::get_channel_name() const {
    return channel_name;
}

std::string ConnectivityManager::describe() const {
    ChannelSnapshot snapshot = get_snapshot();
    std::string description = channel_name + " " + to_string(snapshot.status);
    if (snapshot.consecutive_failures > 0) {
        description += " (" + std::to_string(snapshot.consecutive_failures) + " failures, last: " +
                       snapshot.last_error_message + ")";
    }
    return description;
}

int ConnectivityManager::next_backoff_seconds() const {
    if (channel_state.consecutive_failures <= 1) {
        return policy.initial_backoff_seconds;
    }
    double grown_backoff = std::ceil(channel_state.backoff_seconds * policy.backoff_multiplier);
    return static_cast<int>(std::min(grown_backoff, static_cast<double>(policy.max_backoff_seconds)));
}

std::string to_string(ConnectivityManager::ChannelStatus channel_status) {
    switch (channel_status) {
        case ConnectivityManager::ChannelStatus::CONNECTED:
            return "CONNECTED";
        case ConnectivityManager::ChannelStatus::DEGRADED:
            return "DEGRADED";
        case ConnectivityManager::ChannelStatus::DISCONNECTED:
            return "DISCONNECTED";
    }
    return "UNKNOWN";
}

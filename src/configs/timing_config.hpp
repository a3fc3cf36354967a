// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

struct TimingConfig {
    // ========================================================================
    // TRADING LOOP CADENCE
    // ========================================================================

    int loop_poll_interval_milliseconds = 1000;             // Sleep between loop ticks
    int action_window_buffer_seconds = 10;                  // Ticks act only while 0 < second <= buffer

    // ========================================================================
    // END OF DAY LIQUIDATION
    // ========================================================================

    int end_of_day_hour_utc = 20;                           // Hour (UTC) of the liquidation minute
    int end_of_day_minute_utc = 59;                         // Minute (UTC) of the liquidation minute

    // ========================================================================
    // DATA SYNCHRONIZATION BACKOFF
    // ========================================================================

    int data_sync_retry_backoff_milliseconds = 300;         // Wait before reclassifying lagging feeds
    int data_sync_max_retry_rounds = 10;                    // Retry rounds before giving up on the tick
    int stale_data_backoff_seconds = 50;                    // Wait after a tick aborted on stale data

    // ========================================================================
    // ORDER MANAGEMENT
    // ========================================================================

    int order_cancellation_processing_delay_milliseconds = 100;  // Delay between consecutive cancels

    // ========================================================================
    // BROKER CONNECTION
    // ========================================================================

    int broker_connection_max_attempts = 5;                 // Connect attempts before giving up
    int broker_connection_retry_delay_seconds = 1;          // Delay between connect attempts
};

#endif // TIMING_CONFIG_HPP

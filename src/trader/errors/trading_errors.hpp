#ifndef TRADING_ERRORS_HPP
#define TRADING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace IntradayTrader {
namespace Core {

// Base for every error raised by the trading core
class TradingError : public std::runtime_error {
public:
    explicit TradingError(const std::string& error_message) : std::runtime_error(error_message) {}
};

// Interval string is not <integer><unit>
class InvalidIntervalFormat : public TradingError {
public:
    explicit InvalidIntervalFormat(const std::string& interval_text)
        : TradingError("Invalid interval format: '" + interval_text + "'") {}
};

// Instrument string is not SYMBOL-CURRENCY-TRADETYPE
class InvalidInstrumentFormat : public TradingError {
public:
    explicit InvalidInstrumentFormat(const std::string& instrument_text)
        : TradingError("Invalid instrument format: '" + instrument_text + "' (expected SYMBOL-CURRENCY-TRADETYPE)") {}
};

class InvalidOrder : public TradingError {
public:
    explicit InvalidOrder(const std::string& error_message) : TradingError("Invalid order: " + error_message) {}
};

class OrderNotFound : public TradingError {
public:
    explicit OrderNotFound(const std::string& order_id) : TradingError("Order not found: " + order_id) {}
};

class UnknownTradeType : public TradingError {
public:
    explicit UnknownTradeType(const std::string& trade_type_text) : TradingError("Unknown trade type: " + trade_type_text) {}
};

// Broker or data transport failure
class ConnectionError : public TradingError {
public:
    explicit ConnectionError(const std::string& error_message) : TradingError("Connection error: " + error_message) {}
};

// Broker, strategy or feeds missing when the loop starts
class SetupError : public TradingError {
public:
    explicit SetupError(const std::string& error_message) : TradingError("Setup error: " + error_message) {}
};

} // namespace Core
} // namespace IntradayTrader

#endif // TRADING_ERRORS_HPP

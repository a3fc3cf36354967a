#include "yahoo_finance_grabber.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace IntradayTrader {
namespace API {

namespace {

const std::map<std::string, std::string>& max_period_by_interval() {
    static const std::map<std::string, std::string> max_periods = {
        {"1m", "7d"},
        {"2m", "7d"},
        {"5m", "60d"},
        {"15m", "60d"},
        {"30m", "60d"},
        {"60m", "730d"},
        {"90m", "60d"},
        {"1h", "730d"}
    };
    return max_periods;
}

long long to_unix_seconds(Core::TimePoint time_point) {
    return std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
}

bool is_row_complete(const json& quote_object, size_t row_index) {
    static const char* const quote_fields[] = {"open", "high", "low", "close", "volume"};
    for (const char* field_name : quote_fields) {
        if (!quote_object.contains(field_name) || !quote_object[field_name].is_array()) {
            return false;
        }
        const json& field_values = quote_object[field_name];
        if (row_index >= field_values.size() || field_values[row_index].is_null()) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

YahooFinanceGrabber::YahooFinanceGrabber(const DataConfig& data_config_param, ConnectivityManager& connectivity_manager_ref)
    : data_config(data_config_param), connectivity_manager(connectivity_manager_ref) {}

std::string YahooFinanceGrabber::get_provider_name() const {
    return "Yahoo Finance";
}

std::string YahooFinanceGrabber::resolve_period(const std::string& interval, const std::string& period) {
    if (period != "max") {
        return period;
    }
    auto max_period_iterator = max_period_by_interval().find(interval);
    if (max_period_iterator == max_period_by_interval().end()) {
        return period;
    }
    return max_period_iterator->second;
}

Core::BarTable YahooFinanceGrabber::fetch_historical(const Core::HistoricalDataRequest& request) {
    if (request.symbol.empty()) {
        throw std::runtime_error("Symbol is required for historical data request");
    }
    if (request.interval.empty()) {
        throw std::runtime_error("Interval is required for historical data request");
    }

    std::string request_url = build_chart_url(request);
    HttpRequest http_request(request_url, {}, data_config.retry_count, data_config.timeout_seconds,
                             data_config.enable_ssl_verification, data_config.rate_limit_delay_ms);

    HttpResponse http_response = http_get(http_request, connectivity_manager);
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Yahoo Finance chart request for " + request.symbol + " returned HTTP " +
                                    std::to_string(http_response.status_code));
    }

    return parse_chart_response(http_response.body);
}

std::string YahooFinanceGrabber::build_chart_url(const Core::HistoricalDataRequest& request) const {
    std::string request_url = replace_url_placeholder(data_config.provider_base_url + data_config.chart_endpoint, request.symbol);
    request_url += "?interval=" + request.interval;

    if (request.start_time) {
        Core::TimePoint end_time = request.end_time ? *request.end_time : std::chrono::system_clock::now();
        request_url += "&period1=" + std::to_string(to_unix_seconds(*request.start_time));
        request_url += "&period2=" + std::to_string(to_unix_seconds(end_time));
    } else {
        request_url += "&range=" + resolve_period(request.interval, request.period);
    }
    return request_url;
}

Core::BarTable YahooFinanceGrabber::parse_chart_response(const std::string& response_body) {
    Core::BarTable bars;
    if (response_body.empty()) {
        return bars;
    }

    try {
        json response_json = json::parse(response_body);

        if (!response_json.contains("chart") || !response_json["chart"].is_object()) {
            throw std::runtime_error("Invalid response format from Yahoo Finance chart API - missing chart");
        }

        const json& chart_object = response_json["chart"];
        if (chart_object.contains("error") && !chart_object["error"].is_null()) {
            std::string error_description = chart_object["error"].value("description", std::string("unknown error"));
            throw std::runtime_error("Yahoo Finance chart API error: " + error_description);
        }

        if (!chart_object.contains("result") || !chart_object["result"].is_array() || chart_object["result"].empty()) {
            return bars;
        }

        const json& chart_result = chart_object["result"][0];
        if (!chart_result.contains("timestamp") || !chart_result["timestamp"].is_array()) {
            return bars;
        }

        const json& timestamps = chart_result["timestamp"];
        if (!chart_result.contains("indicators") || !chart_result["indicators"].contains("quote") ||
            !chart_result["indicators"]["quote"].is_array() || chart_result["indicators"]["quote"].empty()) {
            throw std::runtime_error("Invalid response format from Yahoo Finance chart API - missing quote data");
        }
        const json& quote_object = chart_result["indicators"]["quote"][0];

        bars.reserve(timestamps.size());
        for (size_t row_index = 0; row_index < timestamps.size(); ++row_index) {
            if (timestamps[row_index].is_null() || !is_row_complete(quote_object, row_index)) {
                continue;
            }

            Core::Bar bar;
            bar.timestamp = TimeUtils::from_unix_seconds(timestamps[row_index].get<long long>());
            bar.open_price = quote_object["open"][row_index].get<double>();
            bar.high_price = quote_object["high"][row_index].get<double>();
            bar.low_price = quote_object["low"][row_index].get<double>();
            bar.close_price = quote_object["close"][row_index].get<double>();
            bar.volume = quote_object["volume"][row_index].get<double>();
            bars.push_back(bar);
        }

    } catch (const json::exception& json_error) {
        throw std::runtime_error("Failed to parse Yahoo Finance chart response: " + std::string(json_error.what()));
    }

    return bars;
}

} // namespace API
} // namespace IntradayTrader

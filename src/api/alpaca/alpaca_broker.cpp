#include "alpaca_broker.hpp"
#include "logging/logs/broker_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace IntradayTrader {
namespace API {

using IntradayTrader::Logging::BrokerLogs;

namespace {

constexpr long HTTP_NOT_FOUND = 404;

// Alpaca encodes most numbers as strings
double read_number(const json& json_object, const std::string& field_name) {
    if (!json_object.contains(field_name) || json_object[field_name].is_null()) {
        return 0.0;
    }
    const json& field_value = json_object[field_name];
    if (field_value.is_string()) {
        return std::stod(field_value.get<std::string>());
    }
    return field_value.get<double>();
}

json parse_body(const HttpResponse& http_response, const std::string& error_context) {
    try {
        return json::parse(http_response.body);
    } catch (const json::exception& json_error) {
        throw std::runtime_error("Failed to parse " + error_context + " response: " + std::string(json_error.what()));
    }
}

std::string describe_failure(const HttpResponse& http_response) {
    std::string failure_text = "HTTP " + std::to_string(http_response.status_code);
    try {
        json error_json = json::parse(http_response.body);
        if (error_json.contains("message") && error_json["message"].is_string()) {
            failure_text += ": " + error_json["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        if (!http_response.body.empty()) {
            failure_text += ": " + http_response.body;
        }
    }
    return failure_text;
}

Core::OrderSide parse_side(const std::string& side_text) {
    return side_text == "sell" ? Core::OrderSide::SELL : Core::OrderSide::BUY;
}

} // anonymous namespace

AlpacaBroker::AlpacaBroker(const BrokerConfig& broker_config_param, ConnectivityManager& connectivity_manager_ref,
                           Logging::LoggingContext& logging_context_ref)
    : broker_config(broker_config_param), connectivity_manager(connectivity_manager_ref),
      logging_context(logging_context_ref), connected(false) {}

AlpacaBroker::~AlpacaBroker() {
    connected = false;
}

void AlpacaBroker::start() {
    if (broker_config.api_key.empty()) {
        throw Core::SetupError("Alpaca API key is required but not provided");
    }
    if (broker_config.api_secret.empty()) {
        throw Core::SetupError("Alpaca API secret is required but not provided");
    }
    if (broker_config.base_url.empty()) {
        throw Core::SetupError("Alpaca base URL is required but not provided");
    }

    connected = true;
    try {
        double available_cash = get_cash();
        BrokerLogs::log_broker_started(logging_context, get_broker_name(), available_cash);
    } catch (const std::exception& exception_error) {
        connected = false;
        throw Core::ConnectionError("Alpaca account check failed: " + std::string(exception_error.what()));
    }
}

void AlpacaBroker::stop() {
    if (connected) {
        connected = false;
        BrokerLogs::log_broker_stopped(logging_context, get_broker_name());
    }
}

Core::TimePoint AlpacaBroker::now() const {
    ensure_connected("now");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.clock), "GET", "");
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca clock request failed: " + describe_failure(http_response));
    }

    json clock_json = parse_body(http_response, "Alpaca clock");
    if (!clock_json.contains("timestamp") || !clock_json["timestamp"].is_string()) {
        throw std::runtime_error("Invalid response format from Alpaca clock API - missing timestamp field");
    }
    return TimeUtils::parse_iso8601_utc(clock_json["timestamp"].get<std::string>());
}

double AlpacaBroker::get_cash() const {
    ensure_connected("get_cash");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.account), "GET", "");
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca account request failed: " + describe_failure(http_response));
    }

    json account_json = parse_body(http_response, "Alpaca account");
    if (!account_json.contains("cash")) {
        throw std::runtime_error("Invalid response format from Alpaca account API - missing cash field");
    }
    return read_number(account_json, "cash");
}

Core::PositionMap AlpacaBroker::get_positions(const std::vector<std::string>& symbols) const {
    ensure_connected("get_positions");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.positions), "GET", "");
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca positions request failed: " + describe_failure(http_response));
    }

    json positions_json = parse_body(http_response, "Alpaca positions");
    if (!positions_json.is_array()) {
        throw std::runtime_error("Invalid response format from Alpaca positions API");
    }

    Core::PositionMap positions;
    for (const json& position_json : positions_json) {
        std::string symbol = position_json.value("symbol", std::string());
        if (symbol.empty()) {
            continue;
        }
        if (!symbols.empty() && std::find(symbols.begin(), symbols.end(), symbol) == symbols.end()) {
            continue;
        }

        Core::Position position;
        position.symbol = symbol;
        position.currency = broker_config.currency;
        position.trade_type = Core::TradeType::SPOT;
        position.quantity = static_cast<int>(read_number(position_json, "qty"));
        position.average_cost = read_number(position_json, "avg_entry_price");
        position.unrealized_pnl = read_number(position_json, "unrealized_pl");
        positions[symbol] = position;
    }
    return positions;
}

std::string AlpacaBroker::build_order_body(const Core::OrderRequest& order_request) {
    if (order_request.instrument.trade_type != Core::TradeType::SPOT) {
        throw Core::UnknownTradeType(Core::to_string(order_request.instrument.trade_type) + " is not tradable on Alpaca");
    }

    json order_json;
    order_json["symbol"] = order_request.instrument.symbol;
    order_json["qty"] = std::to_string(order_request.quantity);
    order_json["side"] = order_request.side == Core::OrderSide::BUY ? "buy" : "sell";

    std::string time_in_force;
    switch (order_request.time_in_force) {
        case Core::TimeInForce::DAY: time_in_force = "day"; break;
        case Core::TimeInForce::AM: time_in_force = "opg"; break;
        case Core::TimeInForce::PM: time_in_force = "cls"; break;
        case Core::TimeInForce::EXTENDED:
            time_in_force = "day";
            order_json["extended_hours"] = true;
            break;
        case Core::TimeInForce::GOOD_TILL_CANCEL: time_in_force = "gtc"; break;
        case Core::TimeInForce::GTC_EXTENDED:
            time_in_force = "gtc";
            order_json["extended_hours"] = true;
            break;
        case Core::TimeInForce::FILL_OR_KILL: time_in_force = "fok"; break;
    }

    switch (order_request.order_type) {
        case Core::OrderType::MARKET:
            order_json["type"] = "market";
            break;
        case Core::OrderType::LIMIT:
            order_json["type"] = "limit";
            break;
        case Core::OrderType::STOP:
            order_json["type"] = "stop";
            break;
        case Core::OrderType::STOP_LIMIT:
            order_json["type"] = "stop_limit";
            break;
        case Core::OrderType::TRAILING:
            order_json["type"] = "trailing_stop";
            break;
        case Core::OrderType::MARKET_ON_CLOSE:
            order_json["type"] = "market";
            time_in_force = "cls";
            break;
        case Core::OrderType::LIMIT_ON_CLOSE:
            order_json["type"] = "limit";
            time_in_force = "cls";
            break;
        case Core::OrderType::TRAILING_LIMIT:
            throw Core::InvalidOrder("TRAILING_LIMIT orders are not supported by Alpaca");
    }
    order_json["time_in_force"] = time_in_force;

    if (order_request.limit_price) {
        order_json["limit_price"] = std::to_string(*order_request.limit_price);
    }
    if (order_request.stop_price) {
        if (order_request.order_type == Core::OrderType::TRAILING) {
            order_json["trail_price"] = std::to_string(*order_request.stop_price);
        } else {
            order_json["stop_price"] = std::to_string(*order_request.stop_price);
        }
    }
    return order_json.dump();
}

Core::OrderPlacementResult AlpacaBroker::place_order(const Core::OrderRequest& order_request) {
    ensure_connected("place_order");
    std::string order_body = build_order_body(order_request);

    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.orders), "POST", order_body);

    Core::OrderPlacementResult placement_result;
    if (!http_response.is_success()) {
        placement_result.error_code = static_cast<int>(http_response.status_code);
        placement_result.error_message = describe_failure(http_response);
        BrokerLogs::log_request_failed(logging_context, get_broker_name(), "place_order", placement_result.error_message);
        return placement_result;
    }

    json order_json = parse_body(http_response, "Alpaca order");
    placement_result.order_id = order_json.value("id", std::string());
    placement_result.status = order_json.value("status", std::string());
    placement_result.filled_price = read_number(order_json, "filled_avg_price");
    return placement_result;
}

void AlpacaBroker::cancel_order(const std::string& order_id) {
    ensure_connected("cancel_order");
    if (order_id.empty()) {
        throw Core::InvalidOrder("order id is required for cancellation");
    }

    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.orders) + "/" + order_id, "DELETE", "");
    if (http_response.status_code == HTTP_NOT_FOUND) {
        throw Core::OrderNotFound(order_id);
    }
    if (!http_response.is_success()) {
        throw Core::InvalidOrder("cancel of " + order_id + " refused: " + describe_failure(http_response));
    }
}

std::optional<std::string> AlpacaBroker::get_order_status(const std::string& order_id) const {
    ensure_connected("get_order_status");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.orders) + "/" + order_id, "GET", "");
    if (http_response.status_code == HTTP_NOT_FOUND) {
        return std::nullopt;
    }
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca order request failed: " + describe_failure(http_response));
    }

    json order_json = parse_body(http_response, "Alpaca order");
    if (!order_json.contains("status") || !order_json["status"].is_string()) {
        throw std::runtime_error("Invalid response format from Alpaca order API - missing status field");
    }
    return order_json["status"].get<std::string>();
}

std::vector<Core::OpenOrder> AlpacaBroker::get_open_orders() const {
    ensure_connected("get_open_orders");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.orders) + "?status=open", "GET", "");
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca open orders request failed: " + describe_failure(http_response));
    }

    json orders_json = parse_body(http_response, "Alpaca open orders");
    if (!orders_json.is_array()) {
        throw std::runtime_error("Invalid response format from Alpaca orders API");
    }

    std::vector<Core::OpenOrder> open_orders;
    for (const json& order_json : orders_json) {
        Core::OpenOrder open_order;
        open_order.order_id = order_json.value("id", std::string());
        open_order.symbol = order_json.value("symbol", std::string());
        open_order.side = parse_side(order_json.value("side", std::string()));
        open_order.quantity = static_cast<int>(read_number(order_json, "qty"));
        open_order.status = order_json.value("status", std::string());
        if (!open_order.order_id.empty()) {
            open_orders.push_back(open_order);
        }
    }
    return open_orders;
}

double AlpacaBroker::get_filled_price(const std::string& order_id) const {
    ensure_connected("get_filled_price");
    HttpResponse http_response = make_authenticated_request(build_url(broker_config.endpoints.orders) + "/" + order_id, "GET", "");
    if (http_response.status_code == HTTP_NOT_FOUND) {
        throw Core::OrderNotFound(order_id);
    }
    if (!http_response.is_success()) {
        throw Core::ConnectionError("Alpaca order request failed: " + describe_failure(http_response));
    }
    return read_number(parse_body(http_response, "Alpaca order"), "filled_avg_price");
}

BrokerStatusVocabulary AlpacaBroker::get_status_vocabulary() const {
    return BrokerStatusVocabulary::ALPACA;
}

std::string AlpacaBroker::get_broker_name() const {
    return "Alpaca";
}

HttpRequest AlpacaBroker::build_authenticated_request(const std::string& request_url, const std::string& method,
                                                      const std::string& request_body) const {
    std::vector<std::string> auth_headers = {
        "APCA-API-KEY-ID: " + broker_config.api_key,
        "APCA-API-SECRET-KEY: " + broker_config.api_secret
    };
    // Order placement and cancellation are sent once; a timed out POST may already be live
    int attempt_count = resolve_attempt_limit(method, broker_config.retry_count);
    return HttpRequest(request_url, auth_headers, attempt_count, broker_config.timeout_seconds,
                       broker_config.enable_ssl_verification, broker_config.rate_limit_delay_ms, request_body);
}

HttpResponse AlpacaBroker::make_authenticated_request(const std::string& request_url, const std::string& method,
                                                      const std::string& request_body) const {
    HttpRequest http_request = build_authenticated_request(request_url, method, request_body);

    if (method == "GET") {
        return http_get(http_request, connectivity_manager);
    }
    if (method == "POST") {
        return http_post(http_request, connectivity_manager);
    }
    if (method == "DELETE") {
        return http_delete(http_request, connectivity_manager);
    }
    throw std::runtime_error("Unsupported HTTP method: " + method);
}

std::string AlpacaBroker::build_url(const std::string& endpoint) const {
    if (endpoint.empty()) {
        throw std::runtime_error("Endpoint is required for URL construction");
    }
    return broker_config.base_url + endpoint;
}

void AlpacaBroker::ensure_connected(const std::string& operation_name) const {
    if (!connected) {
        throw Core::ConnectionError("Alpaca broker not connected (" + operation_name + ")");
    }
}

} // namespace API
} // namespace IntradayTrader

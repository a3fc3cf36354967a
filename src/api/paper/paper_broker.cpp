#include "paper_broker.hpp"
#include "logging/logs/broker_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include <cstdlib>

namespace IntradayTrader {
namespace API {

using IntradayTrader::Logging::BrokerLogs;

namespace {

// Non-zero error code reported when a market order cannot be priced
constexpr int PAPER_REJECT_NO_PRICE = 201;

} // anonymous namespace

PaperBroker::PaperBroker(const BrokerConfig& broker_config_param, std::shared_ptr<DataGrabberInterface> price_grabber_param,
                         Core::ClockSource& clock_source_ref, Logging::LoggingContext& logging_context_ref)
    : broker_config(broker_config_param), price_grabber(std::move(price_grabber_param)), clock_source(clock_source_ref),
      logging_context(logging_context_ref), started(false), cash_balance(broker_config_param.paper_starting_cash),
      next_order_number(1) {}

void PaperBroker::start() {
    if (!price_grabber) {
        throw Core::ConnectionError("paper broker has no price source");
    }
    started = true;
    BrokerLogs::log_broker_started(logging_context, get_broker_name(), cash_balance);
}

void PaperBroker::stop() {
    if (started) {
        started = false;
        BrokerLogs::log_broker_stopped(logging_context, get_broker_name());
    }
}

bool PaperBroker::is_started() const {
    return started;
}

Core::TimePoint PaperBroker::now() const {
    return clock_source.now();
}

double PaperBroker::get_cash() const {
    return cash_balance;
}

Core::PositionMap PaperBroker::get_positions(const std::vector<std::string>& symbols) const {
    if (symbols.empty()) {
        return positions;
    }

    Core::PositionMap requested_positions;
    for (const std::string& symbol : symbols) {
        auto position_iterator = positions.find(symbol);
        if (position_iterator != positions.end()) {
            requested_positions[symbol] = position_iterator->second;
        }
    }
    return requested_positions;
}

Core::OrderPlacementResult PaperBroker::place_order(const Core::OrderRequest& order_request) {
    ensure_started("place_order");
    if (order_request.quantity <= 0) {
        throw Core::InvalidOrder("paper order quantity must be positive");
    }

    Core::OrderPlacementResult placement_result;
    placement_result.order_id = generate_order_id();

    PaperOrder paper_order;
    paper_order.request = order_request;

    bool fills_immediately = order_request.order_type == Core::OrderType::MARKET ||
                             order_request.order_type == Core::OrderType::MARKET_ON_CLOSE;
    if (!fills_immediately) {
        paper_order.status = "new";
        orders[placement_result.order_id] = paper_order;
        placement_result.status = paper_order.status;
        BrokerLogs::log_order_resting(logging_context, placement_result.order_id, order_request);
        return placement_result;
    }

    double fill_price = 0.0;
    std::string rejection_reason;
    try {
        fill_price = fetch_latest_price(order_request.instrument.symbol);
        if (fill_price <= 0.0) {
            rejection_reason = "no price available";
        }
    } catch (const std::exception& exception_error) {
        rejection_reason = exception_error.what();
    }

    if (!rejection_reason.empty()) {
        paper_order.status = "rejected";
        orders[placement_result.order_id] = paper_order;
        placement_result.status = paper_order.status;
        placement_result.error_code = PAPER_REJECT_NO_PRICE;
        placement_result.error_message = rejection_reason;
        BrokerLogs::log_paper_rejection(logging_context, placement_result.order_id, order_request.instrument.symbol, rejection_reason);
        return placement_result;
    }

    apply_fill(order_request, fill_price);
    paper_order.status = "filled";
    paper_order.filled_price = fill_price;
    orders[placement_result.order_id] = paper_order;

    placement_result.status = paper_order.status;
    placement_result.filled_price = fill_price;
    BrokerLogs::log_paper_fill(logging_context, placement_result.order_id, order_request, fill_price, cash_balance);
    return placement_result;
}

void PaperBroker::cancel_order(const std::string& order_id) {
    ensure_started("cancel_order");
    auto order_iterator = orders.find(order_id);
    if (order_iterator == orders.end()) {
        throw Core::OrderNotFound(order_id);
    }
    if (order_iterator->second.status != "new") {
        throw Core::InvalidOrder("order " + order_id + " is " + order_iterator->second.status + " and cannot be cancelled");
    }
    order_iterator->second.status = "canceled";
}

std::optional<std::string> PaperBroker::get_order_status(const std::string& order_id) const {
    auto order_iterator = orders.find(order_id);
    if (order_iterator == orders.end()) {
        return std::nullopt;
    }
    return order_iterator->second.status;
}

std::vector<Core::OpenOrder> PaperBroker::get_open_orders() const {
    std::vector<Core::OpenOrder> open_orders;
    for (const auto& order_entry : orders) {
        if (order_entry.second.status != "new") {
            continue;
        }
        Core::OpenOrder open_order;
        open_order.order_id = order_entry.first;
        open_order.symbol = order_entry.second.request.instrument.symbol;
        open_order.side = order_entry.second.request.side;
        open_order.quantity = order_entry.second.request.quantity;
        open_order.status = order_entry.second.status;
        open_orders.push_back(open_order);
    }
    return open_orders;
}

double PaperBroker::get_filled_price(const std::string& order_id) const {
    auto order_iterator = orders.find(order_id);
    if (order_iterator == orders.end()) {
        throw Core::OrderNotFound(order_id);
    }
    return order_iterator->second.filled_price;
}

BrokerStatusVocabulary PaperBroker::get_status_vocabulary() const {
    return BrokerStatusVocabulary::ALPACA;
}

std::string PaperBroker::get_broker_name() const {
    return "Paper";
}

void PaperBroker::ensure_started(const std::string& operation_name) const {
    if (!started) {
        throw Core::ConnectionError("paper broker not started (" + operation_name + ")");
    }
}

std::string PaperBroker::generate_order_id() {
    return "paper-" + std::to_string(next_order_number++);
}

double PaperBroker::fetch_latest_price(const std::string& symbol) {
    Core::HistoricalDataRequest price_request;
    price_request.symbol = symbol;
    price_request.interval = broker_config.paper_price_interval;
    price_request.period = broker_config.paper_price_period;

    Core::BarTable price_bars = price_grabber->fetch_historical(price_request);
    if (price_bars.empty()) {
        return 0.0;
    }
    return price_bars.back().close_price;
}

void PaperBroker::apply_fill(const Core::OrderRequest& order_request, double fill_price) {
    const std::string& symbol = order_request.instrument.symbol;
    int signed_quantity = order_request.signed_quantity();
    cash_balance -= signed_quantity * fill_price;

    auto position_iterator = positions.find(symbol);
    if (position_iterator == positions.end()) {
        Core::Position new_position;
        new_position.symbol = symbol;
        new_position.currency = order_request.instrument.currency;
        new_position.trade_type = order_request.instrument.trade_type;
        new_position.quantity = signed_quantity;
        new_position.average_cost = fill_price;
        positions[symbol] = new_position;
        return;
    }

    Core::Position& position = position_iterator->second;
    int previous_quantity = position.quantity;
    int resulting_quantity = previous_quantity + signed_quantity;

    if (resulting_quantity == 0) {
        positions.erase(position_iterator);
        return;
    }

    bool same_direction = (previous_quantity > 0) == (signed_quantity > 0);
    if (same_direction) {
        position.average_cost = (previous_quantity * position.average_cost + signed_quantity * fill_price) / resulting_quantity;
    } else if ((previous_quantity > 0) != (resulting_quantity > 0)) {
        // Flipped through flat: the remainder was opened at this fill
        position.average_cost = fill_price;
    }
    position.quantity = resulting_quantity;
}

} // namespace API
} // namespace IntradayTrader

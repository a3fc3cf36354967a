#include "order_status_mapping.hpp"

namespace IntradayTrader {
namespace Core {

OrderStatusMapping::OrderStatusMapping(API::BrokerStatusVocabulary vocabulary_value,
                                       std::unordered_map<std::string, OrderState> status_table_value,
                                       std::unordered_set<std::string> provisional_statuses_value)
    : vocabulary(vocabulary_value), status_table(std::move(status_table_value)),
      provisional_statuses(std::move(provisional_statuses_value)) {}

OrderState OrderStatusMapping::map_status(const std::string& broker_status) const {
    auto status_iterator = status_table.find(broker_status);
    if (status_iterator == status_table.end()) {
        return OrderState::UNKNOWN;
    }
    return status_iterator->second;
}

bool OrderStatusMapping::is_known_status(const std::string& broker_status) const {
    return status_table.find(broker_status) != status_table.end();
}

bool OrderStatusMapping::is_provisional_status(const std::string& broker_status) const {
    return provisional_statuses.count(broker_status) > 0;
}

API::BrokerStatusVocabulary OrderStatusMapping::get_vocabulary() const {
    return vocabulary;
}

size_t OrderStatusMapping::size() const {
    return status_table.size();
}

// TWS order status strings
OrderStatusMapping make_interactive_brokers_status_mapping() {
    return OrderStatusMapping(API::BrokerStatusVocabulary::INTERACTIVE_BROKERS, {
        {"ApiPending", OrderState::PENDING},
        {"PendingSubmit", OrderState::PENDING},
        {"Inactive", OrderState::PENDING},
        {"PreSubmitted", OrderState::SUBMITTED},
        {"Submitted", OrderState::SUBMITTED},
        {"Filled", OrderState::FILLED},
        {"PendingCancel", OrderState::CANCELLED},
        {"Cancelled", OrderState::CANCELLED},
        {"ApiCancelled", OrderState::CANCELLED}
    }, {"PendingCancel"});
}

// Schwab trader API order status strings
OrderStatusMapping make_schwab_status_mapping() {
    return OrderStatusMapping(API::BrokerStatusVocabulary::SCHWAB, {
        {"AWAITING_PARENT_ORDER", OrderState::PENDING},
        {"AWAITING_CONDITION", OrderState::PENDING},
        {"AWAITING_STOP_CONDITION", OrderState::PENDING},
        {"AWAITING_MANUAL_REVIEW", OrderState::PENDING},
        {"AWAITING_UR_OUT", OrderState::PENDING},
        {"AWAITING_RELEASE_TIME", OrderState::PENDING},
        {"PENDING_ACTIVATION", OrderState::PENDING},
        {"PENDING_ACKNOWLEDGEMENT", OrderState::PENDING},
        {"PENDING_REPLACE", OrderState::PENDING},
        {"PENDING_CANCEL", OrderState::PENDING},
        {"PENDING_RECALL", OrderState::PENDING},
        {"ACCEPTED", OrderState::SUBMITTED},
        {"QUEUED", OrderState::SUBMITTED},
        {"WORKING", OrderState::SUBMITTED},
        {"NEW", OrderState::SUBMITTED},
        {"FILLED", OrderState::FILLED},
        {"CANCELED", OrderState::CANCELLED},
        {"REPLACED", OrderState::CANCELLED},
        {"EXPIRED", OrderState::CANCELLED},
        {"REJECTED", OrderState::REJECTED}
    });
}

// Alpaca REST order status strings
OrderStatusMapping make_alpaca_status_mapping() {
    return OrderStatusMapping(API::BrokerStatusVocabulary::ALPACA, {
        {"pending_new", OrderState::PENDING},
        {"suspended", OrderState::PENDING},
        {"new", OrderState::SUBMITTED},
        {"accepted", OrderState::SUBMITTED},
        {"accepted_for_bidding", OrderState::SUBMITTED},
        {"pending_replace", OrderState::SUBMITTED},
        {"done_for_day", OrderState::SUBMITTED},
        {"stopped", OrderState::SUBMITTED},
        {"partially_filled", OrderState::PARTIALLY_FILLED},
        {"filled", OrderState::FILLED},
        {"calculated", OrderState::FILLED},
        {"pending_cancel", OrderState::CANCELLED},
        {"canceled", OrderState::CANCELLED},
        {"expired", OrderState::CANCELLED},
        {"replaced", OrderState::CANCELLED},
        {"rejected", OrderState::REJECTED}
    }, {"pending_cancel"});
}

OrderStatusMapping make_order_status_mapping(API::BrokerStatusVocabulary vocabulary) {
    switch (vocabulary) {
        case API::BrokerStatusVocabulary::INTERACTIVE_BROKERS:
            return make_interactive_brokers_status_mapping();
        case API::BrokerStatusVocabulary::SCHWAB:
            return make_schwab_status_mapping();
        case API::BrokerStatusVocabulary::ALPACA:
            return make_alpaca_status_mapping();
    }
    return make_alpaca_status_mapping();
}

} // namespace Core
} // namespace IntradayTrader

#include <gtest/gtest.h>
#include "trader/orders/order_status_mapping.hpp"

using namespace IntradayTrader::Core;
using IntradayTrader::API::BrokerStatusVocabulary;

TEST(OrderStatusMappingTest, InteractiveBrokersTable) {
    OrderStatusMapping status_mapping = make_interactive_brokers_status_mapping();
    EXPECT_EQ(status_mapping.map_status("PendingSubmit"), OrderState::PENDING);
    EXPECT_EQ(status_mapping.map_status("Inactive"), OrderState::PENDING);
    EXPECT_EQ(status_mapping.map_status("PreSubmitted"), OrderState::SUBMITTED);
    EXPECT_EQ(status_mapping.map_status("Filled"), OrderState::FILLED);
    EXPECT_EQ(status_mapping.map_status("PendingCancel"), OrderState::CANCELLED);
    EXPECT_EQ(status_mapping.map_status("ApiCancelled"), OrderState::CANCELLED);
}

TEST(OrderStatusMappingTest, SchwabTable) {
    OrderStatusMapping status_mapping = make_schwab_status_mapping();
    EXPECT_EQ(status_mapping.map_status("PENDING_CANCEL"), OrderState::PENDING);
    EXPECT_EQ(status_mapping.map_status("AWAITING_STOP_CONDITION"), OrderState::PENDING);
    EXPECT_EQ(status_mapping.map_status("WORKING"), OrderState::SUBMITTED);
    EXPECT_EQ(status_mapping.map_status("FILLED"), OrderState::FILLED);
    EXPECT_EQ(status_mapping.map_status("EXPIRED"), OrderState::CANCELLED);
    EXPECT_EQ(status_mapping.map_status("REJECTED"), OrderState::REJECTED);
}

TEST(OrderStatusMappingTest, AlpacaTable) {
    OrderStatusMapping status_mapping = make_alpaca_status_mapping();
    EXPECT_EQ(status_mapping.map_status("pending_new"), OrderState::PENDING);
    EXPECT_EQ(status_mapping.map_status("new"), OrderState::SUBMITTED);
    EXPECT_EQ(status_mapping.map_status("partially_filled"), OrderState::PARTIALLY_FILLED);
    EXPECT_EQ(status_mapping.map_status("canceled"), OrderState::CANCELLED);
    EXPECT_EQ(status_mapping.map_status("rejected"), OrderState::REJECTED);
}

TEST(OrderStatusMappingTest, UnconfirmedCancelsAreProvisional) {
    EXPECT_TRUE(make_alpaca_status_mapping().is_provisional_status("pending_cancel"));
    EXPECT_FALSE(make_alpaca_status_mapping().is_provisional_status("canceled"));
    EXPECT_TRUE(make_interactive_brokers_status_mapping().is_provisional_status("PendingCancel"));
    EXPECT_FALSE(make_interactive_brokers_status_mapping().is_provisional_status("Cancelled"));
    EXPECT_FALSE(make_schwab_status_mapping().is_provisional_status("PENDING_CANCEL"));
}

TEST(OrderStatusMappingTest, UnmappedStatusIsUnknown) {
    OrderStatusMapping status_mapping = make_alpaca_status_mapping();
    EXPECT_EQ(status_mapping.map_status("Filled"), OrderState::UNKNOWN);
    EXPECT_FALSE(status_mapping.is_known_status("Filled"));
    EXPECT_TRUE(status_mapping.is_known_status("filled"));
}

TEST(OrderStatusMappingTest, FactorySelectsByVocabulary) {
    EXPECT_EQ(make_order_status_mapping(BrokerStatusVocabulary::SCHWAB).get_vocabulary(), BrokerStatusVocabulary::SCHWAB);
    EXPECT_EQ(make_order_status_mapping(BrokerStatusVocabulary::INTERACTIVE_BROKERS).size(), 9u);
}

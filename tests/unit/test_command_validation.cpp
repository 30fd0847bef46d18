#include <gtest/gtest.h>
#include "common/errors.h"
#include "wire/command.h"

using namespace darwin::client;
using namespace darwin::client::wire;

class CommandValidationTest : public ::testing::Test {
protected:
    OrderRequest order(OrderKind kind) {
        OrderRequest r;
        r.order_id = "ORD7";
        r.symbol = "ENI";
        r.side = Side::Buy;
        r.kind = kind;
        r.quantity = 50;
        if (kind != OrderKind::Market) r.price = Decimal::parse("14.2");
        if (kind == OrderKind::TrailingStop) r.trail = Decimal::parse("0.1");
        if (kind == OrderKind::Iceberg) r.visible_quantity = 10;
        return r;
    }
};

TEST_F(CommandValidationTest, EveryOrderKindWithItsParametersIsValid) {
    for (OrderKind k : {OrderKind::Market, OrderKind::Limit, OrderKind::Stop,
                        OrderKind::TrailingStop, OrderKind::Iceberg}) {
        EXPECT_NO_THROW(validateCommand(Command::placeOrder(order(k)))) << toString(k);
    }
}

TEST_F(CommandValidationTest, PriceRules) {
    OrderRequest limit = order(OrderKind::Limit);
    limit.price.reset();
    EXPECT_THROW(validateCommand(Command::placeOrder(limit)), ValidationError);

    limit.price = Decimal::parse("0");
    EXPECT_THROW(validateCommand(Command::placeOrder(limit)), ValidationError);

    limit.price = Decimal::parse("-1");
    EXPECT_THROW(validateCommand(Command::placeOrder(limit)), ValidationError);

    OrderRequest market = order(OrderKind::Market);
    market.price = Decimal::parse("14");
    EXPECT_THROW(validateCommand(Command::placeOrder(market)), ValidationError);
}

TEST_F(CommandValidationTest, QuantityMustBePositive) {
    OrderRequest r = order(OrderKind::Limit);
    r.quantity = 0;
    EXPECT_THROW(validateCommand(Command::placeOrder(r)), ValidationError);
    r.quantity = -5;
    EXPECT_THROW(validateCommand(Command::placeOrder(r)), ValidationError);
}

TEST_F(CommandValidationTest, KindSpecificParameters) {
    OrderRequest trailing = order(OrderKind::TrailingStop);
    trailing.trail.reset();
    EXPECT_THROW(validateCommand(Command::placeOrder(trailing)), ValidationError);

    OrderRequest limit = order(OrderKind::Limit);
    limit.trail = Decimal::parse("0.1");
    EXPECT_THROW(validateCommand(Command::placeOrder(limit)), ValidationError);

    OrderRequest iceberg = order(OrderKind::Iceberg);
    iceberg.visible_quantity = 51;
    EXPECT_THROW(validateCommand(Command::placeOrder(iceberg)), ValidationError);
    iceberg.visible_quantity.reset();
    EXPECT_THROW(validateCommand(Command::placeOrder(iceberg)), ValidationError);
}

TEST_F(CommandValidationTest, IdentifiersCannotCarryDelimiters) {
    OrderRequest r = order(OrderKind::Limit);
    r.symbol = "EN;I";
    EXPECT_THROW(validateCommand(Command::placeOrder(r)), ValidationError);
    r.symbol = "ENI";
    r.order_id = "A,B";
    EXPECT_THROW(validateCommand(Command::placeOrder(r)), ValidationError);
    r.order_id = "";
    EXPECT_THROW(validateCommand(Command::placeOrder(r)), ValidationError);

    EXPECT_THROW(validateCommand(Command::cancelOrder("")), ValidationError);
    EXPECT_THROW(validateCommand(Command::queryPosition("A B")), ValidationError);
}

TEST_F(CommandValidationTest, MissingOrMistypedParameters) {
    Command c = Command::placeOrder(order(OrderKind::Limit));
    c.params["quantity"] = std::string("fifty");
    EXPECT_THROW(validateCommand(c), ValidationError);

    c = Command::placeOrder(order(OrderKind::Limit));
    c.params.erase("symbol");
    EXPECT_THROW(validateCommand(c), ValidationError);

    c = Command::placeOrder(order(OrderKind::Limit));
    c.params["side"] = std::string("HOLD");
    EXPECT_THROW(validateCommand(c), ValidationError);
}

TEST_F(CommandValidationTest, ModifyOrder) {
    EXPECT_NO_THROW(validateCommand(Command::modifyOrder("SIM1", Decimal::parse("10"))));
    EXPECT_THROW(validateCommand(Command::modifyOrder("SIM1", Decimal{})), ValidationError);
    EXPECT_THROW(validateCommand(Command::modifyOrder("SIM1", Decimal::parse("10"), Decimal{})),
                 ValidationError);
}

TEST_F(CommandValidationTest, HistoricalRanges) {
    EXPECT_THROW(validateCommand(Command::dailyCandles("ENI", 0)), ValidationError);
    EXPECT_THROW(validateCommand(Command::intradayCandles("ENI", 1, 0)), ValidationError);
    EXPECT_THROW(validateCommand(Command::ticks("", 1)), ValidationError);

    auto jan = [](unsigned d) { return Timestamp::fromDate(2024, 1, d); };
    EXPECT_NO_THROW(validateCommand(Command::candleRange("ENI", jan(2), jan(2), 60, false)));
    EXPECT_THROW(validateCommand(Command::candleRange("ENI", jan(3), jan(2), 60, false)),
                 ValidationError);
    EXPECT_THROW(validateCommand(Command::candleRange(
                     "ENI", Timestamp::fromTimeOfDay(9, 0, 0), jan(2), 60, false)),
                 ValidationError);

    Command c = Command::candleRange("ENI", jan(1), jan(2), 60, true);
    c.params["after_hours"] = std::string("YES");
    EXPECT_THROW(validateCommand(c), ValidationError);
}

TEST_F(CommandValidationTest, TypedAccessors) {
    Command c = Command::placeOrder(order(OrderKind::Iceberg));
    EXPECT_EQ(c.side(), Side::Buy);
    EXPECT_EQ(c.orderKind(), OrderKind::Iceberg);
    EXPECT_EQ(c.integer("visible_quantity"), 10);
    EXPECT_THROW(c.decimal("symbol"), ValidationError);
    EXPECT_THROW(c.str("nope"), ValidationError);
}

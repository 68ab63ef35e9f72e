#include "AuditRowBuilder.h"

#include "DateTimeConverter.h"

#include <gtest/gtest.h>

#include <sstream>

class AuditRowBuilderTest : public testing::Test
{
public:
    AuditRowBuilderTest()
        : m_series(10)
    {
    }

    static Timestamp at(std::string_view str) { return DateTimeConverter::from_date_time(str).value(); }

    template <class T>
    static std::string str(const T & v)
    {
        std::stringstream ss;
        ss << v;
        return ss.str();
    }

protected:
    void push(std::string_view ts, double price) { m_series.push_sample(Sample{.timestamp = at(ts), .price = price}); }

    TradingCalendar m_calendar;
    PriceSeries m_series;
};

TEST_F(AuditRowBuilderTest, SingleSessionRows)
{
    push("2025-04-04 09:30:00", 100.);
    push("2025-04-04 09:30:02", 102.);
    const PriceLookup lookup(m_series);
    const AuditRowBuilder builder(m_calendar, lookup);

    const std::vector<Timestamp> visited = {
            at("2025-04-04 09:30:02"),
            at("2025-04-04 09:30:01"),
            at("2025-04-04 09:30:00"),
    };
    const auto rows = builder.build(visited, at("2025-04-04 09:30:02"), 100.67, 100.);

    ASSERT_EQ(rows.size(), 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].index, i + 1);
        EXPECT_EQ(rows[i].session, SessionLabel::Morning);
        EXPECT_TRUE(rows[i].is_trading);
        EXPECT_DOUBLE_EQ(rows[i].sma, 100.67);
        EXPECT_EQ(rows[i].boundary, BoundaryTag{});
    }

    EXPECT_EQ(rows[0].point_kind, PointKind::Original);
    EXPECT_EQ(rows[0].price, 102.);
    EXPECT_EQ(rows[0].date_time, "2025-04-04 09:30:02");
    EXPECT_EQ(rows[0].gap_from_now.count(), 0.);

    EXPECT_EQ(rows[1].point_kind, PointKind::Supplemental);
    EXPECT_EQ(rows[1].price, 100.);
    EXPECT_EQ(rows[1].gap_from_now.count(), 1.);

    EXPECT_EQ(rows[2].point_kind, PointKind::Original);
    EXPECT_EQ(str(rows[2].boundary), "same day same session");
}

TEST_F(AuditRowBuilderTest, UnpricedRowsHaveNoAverage)
{
    push("2025-04-04 13:00:00", 100.);
    const PriceLookup lookup(m_series);
    const AuditRowBuilder builder(m_calendar, lookup);

    const auto rows = builder.build({at("2025-04-04 13:00:00"), at("2025-04-04 11:30:00")}, at("2025-04-04 13:00:00"), 100., 100.);

    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[1].price, 0.);
    EXPECT_EQ(rows[1].sma, 0.);
    EXPECT_EQ(rows[1].session, SessionLabel::Morning);
    EXPECT_TRUE(rows[0].boundary.crosses_session);
    EXPECT_TRUE(rows[1].boundary.crosses_session);
    EXPECT_FALSE(rows[1].boundary.crosses_day);
    EXPECT_EQ(str(rows[1].boundary), "crosses session");
}

TEST_F(AuditRowBuilderTest, CrossDayOnlyForOtherDates)
{
    push("2025-04-03 14:59:58", 90.);
    const PriceLookup lookup(m_series);
    const AuditRowBuilder builder(m_calendar, lookup);

    const std::vector<Timestamp> visited = {
            at("2025-04-04 09:30:00"),
            at("2025-04-03 15:00:00"),
    };
    const auto rows = builder.build(visited, at("2025-04-04 09:30:00"), 90., 100.);

    ASSERT_EQ(rows.size(), 2);
    EXPECT_FALSE(rows[0].boundary.crosses_day);
    EXPECT_TRUE(rows[1].boundary.crosses_day);
    EXPECT_EQ(str(rows[0].boundary), "crosses session");
    EXPECT_EQ(str(rows[1].boundary), "crosses day, crosses session");
    EXPECT_EQ(rows[1].session, SessionLabel::Afternoon);
    EXPECT_EQ(rows[1].point_kind, PointKind::Supplemental);
}

TEST_F(AuditRowBuilderTest, PointKindNames)
{
    EXPECT_EQ(str(PointKind::Original), "original");
    EXPECT_EQ(str(PointKind::Supplemental), "supplemental");
    EXPECT_EQ(str(BoundaryTag{.crosses_day = true}), "crosses day");
}

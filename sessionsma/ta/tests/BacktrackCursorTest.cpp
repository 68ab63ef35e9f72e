#include "BacktrackCursor.h"

#include "DateTimeConverter.h"

#include <gtest/gtest.h>

#include <vector>

class BacktrackCursorTest : public testing::Test
{
public:
    static Timestamp at(std::string_view str) { return DateTimeConverter::from_date_time(str).value(); }

    static std::vector<std::string> drain(BacktrackCursor & cursor)
    {
        std::vector<std::string> res;
        while (const auto ts = cursor.next()) {
            res.push_back(DateTimeConverter::date_time(*ts));
        }
        return res;
    }

protected:
    TradingCalendar m_calendar;
};

TEST_F(BacktrackCursorTest, StopsAtLowerBound)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-04 09:30:05"), at("2025-04-04 09:29:55"));

    const std::vector<std::string> expected = {
            "2025-04-04 09:30:05",
            "2025-04-04 09:30:04",
            "2025-04-04 09:30:03",
            "2025-04-04 09:30:02",
            "2025-04-04 09:30:01",
            "2025-04-04 09:30:00",
    };
    EXPECT_EQ(drain(cursor), expected);
    EXPECT_FALSE(cursor.next().has_value());
}

TEST_F(BacktrackCursorTest, JumpsOverMiddayBreak)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-04 13:00:02"), at("2025-04-04 11:29:58"));

    const std::vector<std::string> expected = {
            "2025-04-04 13:00:02",
            "2025-04-04 13:00:01",
            "2025-04-04 13:00:00",
            "2025-04-04 11:30:00",
            "2025-04-04 11:29:59",
            "2025-04-04 11:29:58",
    };
    EXPECT_EQ(drain(cursor), expected);
}

TEST_F(BacktrackCursorTest, JumpsOverWeekend)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-07 09:30:01"), at("2025-04-04 14:59:59"));

    const std::vector<std::string> expected = {
            "2025-04-07 09:30:01",
            "2025-04-07 09:30:00",
            "2025-04-04 15:00:00",
            "2025-04-04 14:59:59",
    };
    EXPECT_EQ(drain(cursor), expected);
}

TEST_F(BacktrackCursorTest, JumpBelowLowerBoundEndsTheWalk)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-04 13:00:01"), at("2025-04-04 12:59:00"));

    EXPECT_EQ(drain(cursor).size(), 2);
    EXPECT_EQ(cursor.position(), at("2025-04-04 11:30:00"));
}

TEST_F(BacktrackCursorTest, BudgetCountsYieldedInstants)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-04 11:30:00"), std::nullopt, 3.);

    const std::vector<std::string> expected = {
            "2025-04-04 11:30:00",
            "2025-04-04 11:29:59",
            "2025-04-04 11:29:58",
    };
    EXPECT_EQ(drain(cursor), expected);
}

TEST_F(BacktrackCursorTest, FractionalBudgetRoundsUp)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-04 11:30:00"), std::nullopt, 2.5);
    EXPECT_EQ(drain(cursor).size(), 3);
}

TEST_F(BacktrackCursorTest, BudgetSkipsNonTradingTime)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-07 09:30:00"), std::nullopt, 2.);

    const std::vector<std::string> expected = {
            "2025-04-07 09:30:00",
            "2025-04-04 15:00:00",
    };
    EXPECT_EQ(drain(cursor), expected);
}

TEST_F(BacktrackCursorTest, NegativeStartYieldsNothing)
{
    BacktrackCursor cursor(m_calendar, Timestamp{-1.}, std::nullopt);
    EXPECT_FALSE(cursor.next().has_value());
}

TEST_F(BacktrackCursorTest, NonTradingWindowYieldsNothing)
{
    BacktrackCursor cursor(m_calendar, at("2025-04-05 10:00:00"), at("2025-04-05 09:59:00"));
    EXPECT_FALSE(cursor.next().has_value());
}

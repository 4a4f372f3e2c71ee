#include <gtest/gtest.h>

#include <TimeOfDay.hpp>

using namespace NScreening;

TEST(TimeOfDay, ParsesHoursMinutesSeconds) {
    auto t = TTimeOfDay::Parse("10:05");
    EXPECT_EQ(t.Hour(), 10);
    EXPECT_EQ(t.Minute(), 5);
    EXPECT_EQ(t.Second(), 0);

    auto u = TTimeOfDay::Parse("18:00:30");
    EXPECT_EQ(u.SinceMidnight(), std::chrono::seconds(18 * 3600 + 30));
    EXPECT_EQ(u.ToString(), "18:00:30");
    EXPECT_EQ(t.ToString(), "10:05");
}

TEST(TimeOfDay, RejectsMalformedText) {
    EXPECT_THROW(TTimeOfDay::Parse("10"), std::invalid_argument);
    EXPECT_THROW(TTimeOfDay::Parse("10-00"), std::invalid_argument);
    EXPECT_THROW(TTimeOfDay::Parse("24:00"), std::invalid_argument);
    EXPECT_THROW(TTimeOfDay::Parse("10:60"), std::invalid_argument);
    EXPECT_THROW(TTimeOfDay::Parse("10:00x"), std::invalid_argument);
    EXPECT_THROW(TTimeOfDay(-1, 0), std::out_of_range);
}

TEST(TimeOfDay, OrderingIgnoresTheDay) {
    EXPECT_TRUE(TTimeOfDay(0, 30) < TTimeOfDay(22, 30));
    EXPECT_TRUE(TTimeOfDay(10, 0) <= TTimeOfDay(10, 0));
    EXPECT_EQ(TTimeOfDay(10, 0), TTimeOfDay::Parse("10:00:00"));
}

TEST(TimeOfDay, PlusWrapsAtMidnight) {
    EXPECT_EQ(TTimeOfDay(22, 30).Plus(std::chrono::hours(2)), TTimeOfDay(0, 30));
    EXPECT_EQ(TTimeOfDay(10, 0).Plus(std::chrono::minutes(120)), TTimeOfDay(12, 0));
    EXPECT_EQ(TTimeOfDay(0, 10).Plus(std::chrono::minutes(-20)), TTimeOfDay(23, 50));
}

TEST(TimeOfDay, AnchoredTimesCompareAcrossMidnight) {
    auto day = DayStart(2026, 10, 19);
    auto lateStart = TTimeOfDay(22, 30).At(day);
    auto lateEnd = lateStart + std::chrono::hours(2);

    EXPECT_LT(TTimeOfDay(23, 0).At(day), lateEnd);
    EXPECT_EQ(TimeOfDayOf(lateEnd), TTimeOfDay(0, 30));
    EXPECT_EQ(StartOfDay(lateEnd), DayStart(2026, 10, 20));
}

TEST(Calendar, ParsesAndFormatsDates) {
    auto day = ParseDate("2024-02-29");
    EXPECT_EQ(day, DayStart(2024, 2, 29));
    EXPECT_EQ(FormatTimePoint(TTimeOfDay(9, 5).At(day)), "2024-02-29 09:05");
    EXPECT_EQ(FormatTimePoint(FromEpochSeconds(0)), "1970-01-01 00:00");
    EXPECT_EQ(ToEpochSeconds(DayStart(1970, 1, 2)), 86400);
}

TEST(Calendar, RejectsImpossibleDates) {
    EXPECT_THROW(ParseDate("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(ParseDate("2023-13-01"), std::invalid_argument);
    EXPECT_THROW(ParseDate("2023/01/01"), std::invalid_argument);
    EXPECT_THROW(DayStart(2023, 4, 31), std::out_of_range);
}

TEST(Calendar, RejectsDatesOutsideClockRange) {
    EXPECT_NO_THROW(DayStart(2262, 1, 1));
    EXPECT_THROW(DayStart(2300, 1, 1), std::out_of_range);
    EXPECT_THROW(DayStart(1600, 1, 1), std::out_of_range);
    EXPECT_THROW(ParseDate("2300-01-01"), std::invalid_argument);
    EXPECT_THROW(FromEpochSeconds(MAX_EPOCH_SECONDS + 1), std::out_of_range);
    EXPECT_THROW(FromEpochSeconds(-MAX_EPOCH_SECONDS - 1), std::out_of_range);
}

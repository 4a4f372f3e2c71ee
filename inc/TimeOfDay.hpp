#pragma once
#include <chrono>
#include <string>

#include "common.hpp"

namespace NScreening {

    // Wall-clock time with no date. Ordering is within a single day only, so
    // 00:30 compares before 22:30. Use At() to get something comparable across
    // midnight.
    class TTimeOfDay {
    public:
        TTimeOfDay(int hour, int minute, int second = 0);

        // "HH:MM" or "HH:MM:SS"
        static TTimeOfDay Parse(const std::string& text);

        int Hour() const {
            return Hour_;
        }
        int Minute() const {
            return Minute_;
        }
        int Second() const {
            return Second_;
        }

        std::chrono::seconds SinceMidnight() const;

        // Wraps around midnight: 23:00 plus two hours is 01:00.
        TTimeOfDay Plus(std::chrono::seconds d) const;

        TTimePoint At(TTimePoint dayStart) const;

        std::string ToString() const;

        bool operator==(const TTimeOfDay& o) const {
            return SinceMidnight() == o.SinceMidnight();
        }
        bool operator!=(const TTimeOfDay& o) const {
            return !(*this == o);
        }
        bool operator<(const TTimeOfDay& o) const {
            return SinceMidnight() < o.SinceMidnight();
        }
        bool operator<=(const TTimeOfDay& o) const {
            return !(o < *this);
        }

    private:
        int Hour_;
        int Minute_;
        int Second_;
    };

    TTimePoint DayStart(int year, unsigned month, unsigned day);

    // "YYYY-MM-DD", midnight of that day.
    TTimePoint ParseDate(const std::string& text);

    TTimePoint StartOfDay(TTimePoint tp);
    TTimeOfDay TimeOfDayOf(TTimePoint tp);

    // "YYYY-MM-DD HH:MM"
    std::string FormatTimePoint(TTimePoint tp);

} // namespace NScreening

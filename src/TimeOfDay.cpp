#include <TimeOfDay.hpp>

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace NScreening {

    namespace {

        constexpr long long SECONDS_PER_DAY = 24 * 60 * 60;

        // Howard Hinnant's days_from_civil / civil_from_days, proleptic Gregorian.
        long long DaysFromCivil(long long y, unsigned m, unsigned d) {
            y -= m <= 2;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        void CivilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
            z += 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
        }

        bool IsLeap(long long y) {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        unsigned DaysInMonth(long long y, unsigned m) {
            static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && IsLeap(y)) {
                return 29;
            }
            return days[m - 1];
        }

        long long FloorDiv(long long a, long long b) {
            long long q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) {
                --q;
            }
            return q;
        }

    } // namespace

    TTimeOfDay::TTimeOfDay(int hour, int minute, int second)
        : Hour_(hour)
        , Minute_(minute)
        , Second_(second) {
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
            throw std::out_of_range("Time of day out of range: " + std::to_string(hour) + ":" +
                                    std::to_string(minute) + ":" + std::to_string(second));
        }
    }

    TTimeOfDay TTimeOfDay::Parse(const std::string& text) {
        std::istringstream iss(text);
        int h = -1;
        int m = -1;
        int s = 0;
        char sep = 0;
        if (!(iss >> h >> sep) || sep != ':' || !(iss >> m)) {
            throw std::invalid_argument("Bad time of day (expected HH:MM[:SS]): " + text);
        }
        if (iss.peek() == ':') {
            iss.get();
            if (!(iss >> s)) {
                throw std::invalid_argument("Bad time of day (expected HH:MM[:SS]): " + text);
            }
        }
        if (iss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Trailing characters in time of day: " + text);
        }
        try {
            return TTimeOfDay(h, m, s);
        } catch (const std::out_of_range& ex) {
            throw std::invalid_argument(ex.what());
        }
    }

    std::chrono::seconds TTimeOfDay::SinceMidnight() const {
        return std::chrono::hours(Hour_) + std::chrono::minutes(Minute_) + std::chrono::seconds(Second_);
    }

    TTimeOfDay TTimeOfDay::Plus(std::chrono::seconds d) const {
        long long total = (SinceMidnight() + d).count() % SECONDS_PER_DAY;
        if (total < 0) {
            total += SECONDS_PER_DAY;
        }
        return TTimeOfDay(static_cast<int>(total / 3600),
                          static_cast<int>(total / 60 % 60),
                          static_cast<int>(total % 60));
    }

    TTimePoint TTimeOfDay::At(TTimePoint dayStart) const {
        return dayStart + SinceMidnight();
    }

    std::string TTimeOfDay::ToString() const {
        char buf[16];
        if (Second_ == 0) {
            std::snprintf(buf, sizeof(buf), "%02d:%02d", Hour_, Minute_);
        } else {
            std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", Hour_, Minute_, Second_);
        }
        return buf;
    }

    TTimePoint DayStart(int year, unsigned month, unsigned day) {
        if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
            throw std::out_of_range("Date out of range: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
        }
        return FromEpochSeconds(DaysFromCivil(year, month, day) * SECONDS_PER_DAY);
    }

    TTimePoint ParseDate(const std::string& text) {
        std::istringstream iss(text);
        int y = 0;
        int m = 0;
        int d = 0;
        char s1 = 0;
        char s2 = 0;
        if (!(iss >> y >> s1 >> m >> s2 >> d) || s1 != '-' || s2 != '-' ||
            iss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Bad date (expected YYYY-MM-DD): " + text);
        }
        if (m < 1 || d < 1) {
            throw std::invalid_argument("Bad date (expected YYYY-MM-DD): " + text);
        }
        try {
            return DayStart(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
        } catch (const std::out_of_range& ex) {
            throw std::invalid_argument(ex.what());
        }
    }

    TTimePoint StartOfDay(TTimePoint tp) {
        return FromEpochSeconds(FloorDiv(ToEpochSeconds(tp), SECONDS_PER_DAY) * SECONDS_PER_DAY);
    }

    TTimeOfDay TimeOfDayOf(TTimePoint tp) {
        long long secs = ToEpochSeconds(tp) - ToEpochSeconds(StartOfDay(tp));
        return TTimeOfDay(static_cast<int>(secs / 3600),
                          static_cast<int>(secs / 60 % 60),
                          static_cast<int>(secs % 60));
    }

    std::string FormatTimePoint(TTimePoint tp) {
        long long y = 0;
        unsigned m = 0;
        unsigned d = 0;
        CivilFromDays(FloorDiv(ToEpochSeconds(tp), SECONDS_PER_DAY), y, m, d);
        TTimeOfDay t = TimeOfDayOf(tp);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02d:%02d", y, m, d, t.Hour(), t.Minute());
        return buf;
    }

} // namespace NScreening

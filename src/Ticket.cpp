#include <Ticket.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace NScreening {

    TMoney ApplyDiscount(ETicketType type, TMoney price) {
        switch (type) {
            case ETicketType::Full:
                return price;
            case ETicketType::Student:
                return price / 2;
            case ETicketType::Bank:
                return price - (price * 3 + 9) / 10;
        }
        throw std::invalid_argument("Unknown ticket type");
    }

    TTicket MakeTicket(const TSession& session, ETicketType type, TSeat seat) {
        if (!std::isalpha(static_cast<unsigned char>(seat.Row)) || seat.Number < 1) {
            throw std::invalid_argument("Bad seat: " + ToString(seat));
        }
        return TTicket{session.Id(), seat, type, ApplyDiscount(type, session.Price())};
    }

    ETicketType ParseTicketType(const std::string& text) {
        if (text == "Full") {
            return ETicketType::Full;
        }
        if (text == "Student") {
            return ETicketType::Student;
        }
        if (text == "Bank") {
            return ETicketType::Bank;
        }
        throw std::invalid_argument("Unknown ticket type: " + text + " (Full|Student|Bank)");
    }

    std::string ToString(ETicketType type) {
        switch (type) {
            case ETicketType::Full:
                return "Full";
            case ETicketType::Student:
                return "Student";
            case ETicketType::Bank:
                return "Bank";
        }
        return "?";
    }

    TSeat ParseSeat(const std::string& text) {
        if (text.size() < 2 || !std::isalpha(static_cast<unsigned char>(text[0]))) {
            throw std::invalid_argument("Bad seat (expected e.g. B7): " + text);
        }
        int number = 0;
        for (size_t i = 1; i < text.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i])) || number > 9999) {
                throw std::invalid_argument("Bad seat (expected e.g. B7): " + text);
            }
            number = number * 10 + (text[i] - '0');
        }
        if (number < 1) {
            throw std::invalid_argument("Seat numbers start at 1: " + text);
        }
        return TSeat{static_cast<char>(std::toupper(static_cast<unsigned char>(text[0]))), number};
    }

    std::string ToString(const TSeat& seat) {
        return std::string(1, seat.Row) + std::to_string(seat.Number);
    }

    std::string FormatMoney(TMoney cents) {
        char buf[32];
        const char* sign = cents < 0 ? "-" : "";
        TMoney abs = cents < 0 ? -cents : cents;
        std::snprintf(buf, sizeof(buf), "%s%lld.%02lld", sign, static_cast<long long>(abs / 100),
                      static_cast<long long>(abs % 100));
        return buf;
    }

    TMoney ParseMoney(const std::string& text) {
        TMoney units = 0;
        TMoney cents = 0;
        int fraction_digits = -1;
        bool has_units = false;
        if (text.empty()) {
            throw std::invalid_argument("Empty amount");
        }
        for (char c : text) {
            if (c == '.' && fraction_digits < 0) {
                if (!has_units) {
                    throw std::invalid_argument("Amount needs a digit before the point: " + text);
                }
                fraction_digits = 0;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Bad amount: " + text);
            }
            if (fraction_digits < 0) {
                units = units * 10 + (c - '0');
                has_units = true;
                if (units > 1000000000) {
                    throw std::invalid_argument("Amount too large: " + text);
                }
            } else if (fraction_digits < 2) {
                cents = cents * 10 + (c - '0');
                ++fraction_digits;
            } else {
                throw std::invalid_argument("At most two decimals: " + text);
            }
        }
        if (fraction_digits == 1) {
            cents *= 10;
        }
        return units * 100 + cents;
    }

} // namespace NScreening

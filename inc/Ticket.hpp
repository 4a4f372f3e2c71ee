#pragma once
#include <string>

#include "Session.hpp"

namespace NScreening {

    enum class ETicketType {
        Full,
        Student, // half price
        Bank     // 30% off for partner bank clients
    };

    struct TSeat {
        char Row = 'A';
        int Number = 1;
    };

    struct TTicket {
        SessionId Session;
        TSeat Seat;
        ETicketType Type;
        TMoney Price;
    };

    TMoney ApplyDiscount(ETicketType type, TMoney price);

    TTicket MakeTicket(const TSession& session, ETicketType type, TSeat seat);

    ETicketType ParseTicketType(const std::string& text);
    std::string ToString(ETicketType type);

    // "B7" -> {'B', 7}
    TSeat ParseSeat(const std::string& text);
    std::string ToString(const TSeat& seat);

    // Cents <-> "12.50"
    std::string FormatMoney(TMoney cents);
    TMoney ParseMoney(const std::string& text);

} // namespace NScreening

#pragma once
#include <optional>
#include <vector>

#include "Session.hpp"

namespace NScreening {

    // Admission check for one room.
    //
    // The scheduler borrows the list of sessions already booked in `room`; the
    // caller owns it, must keep it alive for the scheduler's lifetime and must
    // filter it to that room beforehand (a session from another room is
    // rejected by the constructor). Every query reads the list as it is at the
    // time of the call.
    //
    // Not safe for concurrent check-and-commit: Fits() followed by an insert is
    // two steps, and two callers racing on the same room can both see a free
    // slot. Serialize the pair externally (TScheduleManager does).
    class TSessionScheduler {
    public:
        TSessionScheduler(TRoomPtr room, const std::vector<TSession>& sessions);
        TSessionScheduler(TRoomPtr room, std::vector<TSession>&& sessions) = delete;

        // True when the candidate overlaps none of the booked sessions.
        // Back-to-back sessions (one ends exactly when the other starts) fit.
        bool Fits(const TSession& candidate) const;

        // First booked session the candidate overlaps, if any.
        std::optional<TSession> FindConflict(const TSession& candidate) const;

        const TRoom& Room() const {
            return *Room_;
        }

    private:
        static bool FitsAgainst(const TSession& existing, const TSession& candidate);

    private:
        TRoomPtr Room_;
        const std::vector<TSession>& Sessions;
    };

} // namespace NScreening

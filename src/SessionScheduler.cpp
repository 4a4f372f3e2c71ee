#include <SessionScheduler.hpp>

#include <stdexcept>

namespace NScreening {

    TSessionScheduler::TSessionScheduler(TRoomPtr room, const std::vector<TSession>& sessions)
        : Room_(std::move(room))
        , Sessions(sessions) {
        if (!Room_) {
            throw std::invalid_argument("Scheduler needs a room");
        }
        for (auto const& s : Sessions) {
            if (s.Room().Id != Room_->Id) {
                throw std::invalid_argument("Session id=" + std::to_string(s.Id()) + " belongs to room " +
                                            std::to_string(s.Room().Id) + ", scheduler is for room " +
                                            std::to_string(Room_->Id));
            }
        }
    }

    bool TSessionScheduler::FitsAgainst(const TSession& existing, const TSession& candidate) {
        // Same start always collides, even when one of the two has zero length.
        if (candidate.Start() == existing.Start()) {
            return false;
        }
        if (candidate.Start() < existing.Start()) {
            return candidate.End() <= existing.Start();
        }
        return existing.End() <= candidate.Start();
    }

    std::optional<TSession> TSessionScheduler::FindConflict(const TSession& candidate) const {
        if (candidate.Room().Id != Room_->Id) {
            throw std::invalid_argument("Candidate belongs to room " + std::to_string(candidate.Room().Id) +
                                        ", scheduler is for room " + std::to_string(Room_->Id));
        }
        for (auto const& e : Sessions) {
            if (!FitsAgainst(e, candidate)) {
                return e;
            }
        }
        return std::nullopt;
    }

    bool TSessionScheduler::Fits(const TSession& candidate) const {
        return !FindConflict(candidate).has_value();
    }

} // namespace NScreening

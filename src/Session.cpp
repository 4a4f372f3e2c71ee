#include <Session.hpp>
#include <TimeOfDay.hpp>

namespace NScreening {

    TSession::TSession(TTimePoint start, TFilmPtr film, TRoomPtr room)
        : Start_(start)
        , Film_(std::move(film))
        , Room_(std::move(room)) {
        if (!Film_) {
            throw std::invalid_argument("Session needs a film");
        }
        if (!Room_) {
            throw std::invalid_argument("Session needs a room");
        }
        if (Film_->Duration.count() < 0 || Film_->Duration > MAX_FILM_DURATION) {
            throw std::invalid_argument("Session film has an invalid duration: " + Film_->Name);
        }
    }

    TSession TSession::WithId(SessionId id) const {
        TSession copy = *this;
        copy.Id_ = id;
        return copy;
    }

    std::string TSession::Describe() const {
        return "session id=" + std::to_string(Id_) + " room=\"" + Room_->Name + "\" film=\"" + Film_->Name +
               "\" " + FormatTimePoint(Start()) + " - " + FormatTimePoint(End());
    }

    void ToJSON(json& j, TSession const& s) {
        j = json{{"id", s.Id()}, {"room_id", s.Room().Id}, {"film_id", s.Film().Id}, {"start", ToEpochSeconds(s.Start())}};
    }

} // namespace NScreening

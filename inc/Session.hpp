#pragma once
#include "common.hpp"

namespace NScreening {

    // One showing of a film in a room. Immutable once built; the repository
    // hands out an id through WithId().
    class TSession {
    public:
        TSession(TTimePoint start, TFilmPtr film, TRoomPtr room);

        TSession WithId(SessionId id) const;

        SessionId Id() const {
            return Id_;
        }
        TTimePoint Start() const {
            return Start_;
        }
        TTimePoint End() const {
            return Start_ + Film_->Duration;
        }
        const TFilm& Film() const {
            return *Film_;
        }
        const TRoom& Room() const {
            return *Room_;
        }
        const TFilmPtr& FilmPtr() const {
            return Film_;
        }
        const TRoomPtr& RoomPtr() const {
            return Room_;
        }

        // Room surcharge plus film price.
        TMoney Price() const {
            return Room_->Price + Film_->Price;
        }

        std::string Describe() const;

    private:
        SessionId Id_ = 0;
        TTimePoint Start_;
        TFilmPtr Film_;
        TRoomPtr Room_;
    };

    void ToJSON(json& j, TSession const& s);

} // namespace NScreening

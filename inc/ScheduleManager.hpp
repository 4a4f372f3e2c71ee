#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common.hpp"
#include "Repository.hpp"
#include "SessionScheduler.hpp"
#include "Ticket.hpp"

namespace NScreening {

    // Booking workflow over a repository. AddSession() runs the admission
    // check and the insert under one lock, which is what makes concurrent
    // callers safe; TSessionScheduler alone is not.
    class TScheduleManager {
    public:
        explicit TScheduleManager(std::shared_ptr<ISessionRepository> repo);

        FilmId RegisterFilm(const TFilm& film);
        RoomId RegisterRoom(const TRoom& room);
        std::vector<TFilmPtr> ListFilms();
        std::vector<TRoomPtr> ListRooms();

        // Empty on conflict. Unknown room or film throws.
        std::optional<SessionId> AddSession(RoomId room, FilmId film, TTimePoint start);

        // Dry run of AddSession: the session that would block it, if any.
        std::optional<TSession> CheckSession(RoomId room, FilmId film, TTimePoint start);

        bool RemoveSession(SessionId id);
        std::optional<TSession> GetSession(SessionId id);

        // Sorted by start time.
        std::vector<TSession> ListSessions(RoomId room);
        std::vector<TSession> ListSessions(RoomId room, TTimePoint from, TTimePoint to);

        TTicket IssueTicket(SessionId id, ETicketType type, TSeat seat);

        void Checkpoint();

    private:
        TSession MakeCandidate(RoomId room, FilmId film, TTimePoint start);

    private:
        std::shared_ptr<ISessionRepository> Repo;
        std::mutex Mutex_;
    };

} // namespace NScreening

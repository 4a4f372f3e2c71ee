#include <ScheduleManager.hpp>

#include <algorithm>

namespace NScreening {

    namespace {

        void SortByStart(std::vector<TSession>& sessions) {
            std::sort(sessions.begin(), sessions.end(), [](const TSession& a, const TSession& b) {
                if (a.Start() != b.Start()) {
                    return a.Start() < b.Start();
                }
                return a.Id() < b.Id();
            });
        }

    } // namespace

    TScheduleManager::TScheduleManager(std::shared_ptr<ISessionRepository> repo)
        : Repo(std::move(repo)) {
    }

    FilmId TScheduleManager::RegisterFilm(const TFilm& film) {
        return Repo->AddFilm(film)->Id;
    }

    RoomId TScheduleManager::RegisterRoom(const TRoom& room) {
        return Repo->AddRoom(room)->Id;
    }

    std::vector<TFilmPtr> TScheduleManager::ListFilms() {
        return Repo->ListFilms();
    }

    std::vector<TRoomPtr> TScheduleManager::ListRooms() {
        return Repo->ListRooms();
    }

    TSession TScheduleManager::MakeCandidate(RoomId room, FilmId film, TTimePoint start) {
        auto r = Repo->GetRoom(room);
        if (!r) {
            throw std::runtime_error("Unknown room id=" + std::to_string(room));
        }
        auto f = Repo->GetFilm(film);
        if (!f) {
            throw std::runtime_error("Unknown film id=" + std::to_string(film));
        }
        return TSession(start, f, r);
    }

    std::optional<SessionId> TScheduleManager::AddSession(RoomId room, FilmId film, TTimePoint start) {
        std::lock_guard lk(Mutex_);

        TSession candidate = MakeCandidate(room, film, start);
        auto booked = Repo->ListSessions(room);
        TSessionScheduler scheduler(candidate.RoomPtr(), booked);
        if (!scheduler.Fits(candidate)) {
            return std::nullopt;
        }
        return Repo->AddSession(candidate);
    }

    std::optional<TSession> TScheduleManager::CheckSession(RoomId room, FilmId film, TTimePoint start) {
        std::lock_guard lk(Mutex_);

        TSession candidate = MakeCandidate(room, film, start);
        auto booked = Repo->ListSessions(room);
        TSessionScheduler scheduler(candidate.RoomPtr(), booked);
        return scheduler.FindConflict(candidate);
    }

    bool TScheduleManager::RemoveSession(SessionId id) {
        std::lock_guard lk(Mutex_);
        return Repo->RemoveSession(id);
    }

    std::optional<TSession> TScheduleManager::GetSession(SessionId id) {
        return Repo->GetSession(id);
    }

    std::vector<TSession> TScheduleManager::ListSessions(RoomId room) {
        auto out = Repo->ListSessions(room);
        SortByStart(out);
        return out;
    }

    std::vector<TSession> TScheduleManager::ListSessions(RoomId room, TTimePoint from, TTimePoint to) {
        std::vector<TSession> out;
        for (auto& s : Repo->ListSessions(room)) {
            if (IntervalsOverlap(s.Start(), s.End(), from, to)) {
                out.push_back(s);
            }
        }
        SortByStart(out);
        return out;
    }

    TTicket TScheduleManager::IssueTicket(SessionId id, ETicketType type, TSeat seat) {
        auto s = Repo->GetSession(id);
        if (!s) {
            throw std::runtime_error("Unknown session id=" + std::to_string(id));
        }
        return MakeTicket(*s, type, seat);
    }

    void TScheduleManager::Checkpoint() {
        std::lock_guard lk(Mutex_);
        Repo->Checkpoint();
    }

} // namespace NScreening

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "Session.hpp"
#include "Storage.hpp"

namespace NScreening {

    struct ISessionRepository {
        virtual ~ISessionRepository() = default;

        virtual TFilmPtr AddFilm(const TFilm& f) = 0;
        virtual TRoomPtr AddRoom(const TRoom& r) = 0;
        virtual TFilmPtr GetFilm(FilmId id) = 0;
        virtual TRoomPtr GetRoom(RoomId id) = 0;
        virtual std::vector<TFilmPtr> ListFilms() = 0;
        virtual std::vector<TRoomPtr> ListRooms() = 0;

        virtual SessionId AddSession(const TSession& s) = 0;
        virtual bool RemoveSession(SessionId id) = 0;
        virtual std::optional<TSession> GetSession(SessionId id) = 0;
        virtual std::vector<TSession> ListSessions(RoomId room) = 0;
        virtual std::vector<TSession> ListAll() = 0;

        virtual void Checkpoint() = 0;
    };

    // Catalogue and sessions on top of an IStorage journal.
    //
    // Each change becomes an {"op": ..., "seq": N} entry. It is appended to the
    // journal first and only then applied in memory, so a failed write leaves
    // the repository untouched. On construction the last checkpoint is loaded
    // and the newer journal entries are replayed over it.
    class TSessionRepository: public ISessionRepository {
    public:
        explicit TSessionRepository(std::shared_ptr<IStorage> storage);

        TFilmPtr AddFilm(const TFilm& f) override;
        TRoomPtr AddRoom(const TRoom& r) override;
        TFilmPtr GetFilm(FilmId id) override;
        TRoomPtr GetRoom(RoomId id) override;
        std::vector<TFilmPtr> ListFilms() override;
        std::vector<TRoomPtr> ListRooms() override;

        SessionId AddSession(const TSession& s) override;
        bool RemoveSession(SessionId id) override;
        std::optional<TSession> GetSession(SessionId id) override;
        std::vector<TSession> ListSessions(RoomId room) override;
        std::vector<TSession> ListAll() override;

        // Writes the whole state and lets the storage drop covered entries.
        void Checkpoint() override;

        uint64_t LastSequence();

    private:
        void Reload();
        void Commit(json entry);
        void Apply(const json& entry);
        TSession SessionFromJSON(const json& j) const;
        json StateToJson() const;

        template <class TMap>
        static uint64_t NextId(const TMap& m) {
            return m.empty() ? 1 : m.rbegin()->first + 1;
        }

    private:
        std::shared_ptr<IStorage> Storage;
        std::mutex Mutex_;
        uint64_t Seq = 0;
        std::map<FilmId, TFilmPtr> Films;
        std::map<RoomId, TRoomPtr> Rooms;
        std::map<SessionId, TSession> Sessions;
    };

} // namespace NScreening

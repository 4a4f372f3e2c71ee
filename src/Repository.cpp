#include <Repository.hpp>

namespace NScreening {

    TSessionRepository::TSessionRepository(std::shared_ptr<IStorage> storage)
        : Storage(std::move(storage)) {
        Reload();
    }

    TFilmPtr TSessionRepository::AddFilm(const TFilm& f) {
        std::lock_guard lk(Mutex_);
        TFilm nf = f;
        nf.Id = NextId(Films);
        json jf;
        ToJSON(jf, nf);
        json je = {{"op", "add_film"}, {"film", jf}};
        Commit(std::move(je));
        return Films.at(nf.Id);
    }

    TRoomPtr TSessionRepository::AddRoom(const TRoom& r) {
        std::lock_guard lk(Mutex_);
        TRoom nr = r;
        nr.Id = NextId(Rooms);
        json jr;
        ToJSON(jr, nr);
        json je = {{"op", "add_room"}, {"room", jr}};
        Commit(std::move(je));
        return Rooms.at(nr.Id);
    }

    TFilmPtr TSessionRepository::GetFilm(FilmId id) {
        std::lock_guard lk(Mutex_);
        auto it = Films.find(id);
        return it == Films.end() ? nullptr : it->second;
    }

    TRoomPtr TSessionRepository::GetRoom(RoomId id) {
        std::lock_guard lk(Mutex_);
        auto it = Rooms.find(id);
        return it == Rooms.end() ? nullptr : it->second;
    }

    std::vector<TFilmPtr> TSessionRepository::ListFilms() {
        std::lock_guard lk(Mutex_);
        std::vector<TFilmPtr> out;
        out.reserve(Films.size());
        for (auto const& kv : Films) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::vector<TRoomPtr> TSessionRepository::ListRooms() {
        std::lock_guard lk(Mutex_);
        std::vector<TRoomPtr> out;
        out.reserve(Rooms.size());
        for (auto const& kv : Rooms) {
            out.push_back(kv.second);
        }
        return out;
    }

    SessionId TSessionRepository::AddSession(const TSession& s) {
        std::lock_guard lk(Mutex_);
        if (!Films.count(s.Film().Id) || !Rooms.count(s.Room().Id)) {
            throw std::runtime_error("Session refers to a film or room missing from the catalogue");
        }
        TSession ns = s.WithId(NextId(Sessions));
        json js;
        ToJSON(js, ns);
        json je = {{"op", "add_session"}, {"session", js}};
        Commit(std::move(je));
        return ns.Id();
    }

    bool TSessionRepository::RemoveSession(SessionId id) {
        std::lock_guard lk(Mutex_);
        if (!Sessions.count(id)) {
            return false;
        }
        json je = {{"op", "remove_session"}, {"id", id}};
        Commit(std::move(je));
        return true;
    }

    std::optional<TSession> TSessionRepository::GetSession(SessionId id) {
        std::lock_guard lk(Mutex_);
        auto it = Sessions.find(id);
        if (it == Sessions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<TSession> TSessionRepository::ListSessions(RoomId room) {
        std::lock_guard lk(Mutex_);
        std::vector<TSession> out;
        for (auto const& kv : Sessions) {
            if (kv.second.Room().Id == room) {
                out.push_back(kv.second);
            }
        }
        return out;
    }

    std::vector<TSession> TSessionRepository::ListAll() {
        std::lock_guard lk(Mutex_);
        std::vector<TSession> out;
        out.reserve(Sessions.size());
        for (auto const& kv : Sessions) {
            out.push_back(kv.second);
        }
        return out;
    }

    void TSessionRepository::Checkpoint() {
        std::lock_guard lk(Mutex_);
        Storage->WriteCheckpoint(StateToJson());
    }

    uint64_t TSessionRepository::LastSequence() {
        std::lock_guard lk(Mutex_);
        return Seq;
    }

    void TSessionRepository::Commit(json entry) {
        const uint64_t seq = Seq + 1;
        entry["seq"] = seq;
        Storage->AppendJournal(entry);
        Apply(entry);
        Seq = seq;
    }

    void TSessionRepository::Apply(const json& entry) {
        const auto op = entry.at("op").get<std::string>();
        if (op == "add_film") {
            auto f = std::make_shared<TFilm>(FilmFromJSON(entry.at("film")));
            Films[f->Id] = f;
        } else if (op == "add_room") {
            auto r = std::make_shared<TRoom>(RoomFromJSON(entry.at("room")));
            Rooms[r->Id] = r;
        } else if (op == "add_session") {
            TSession s = SessionFromJSON(entry.at("session"));
            Sessions.insert_or_assign(s.Id(), s);
        } else if (op == "remove_session") {
            Sessions.erase(entry.at("id").get<SessionId>());
        } else {
            throw std::runtime_error("Unknown journal op: " + op);
        }
    }

    TSession TSessionRepository::SessionFromJSON(const json& j) const {
        auto film = Films.find(j.at("film_id").get<FilmId>());
        auto room = Rooms.find(j.at("room_id").get<RoomId>());
        if (film == Films.end() || room == Rooms.end()) {
            throw std::runtime_error("Session " + j.dump() + " refers to an unknown film or room");
        }
        return TSession(FromEpochSeconds(j.at("start").get<long long>()), film->second, room->second)
            .WithId(j.at("id").get<SessionId>());
    }

    void TSessionRepository::Reload() {
        std::lock_guard lk(Mutex_);
        Films.clear();
        Rooms.clear();
        Sessions.clear();
        Seq = 0;
        try {
            json snap = Storage->ReadCheckpoint();
            if (snap.is_object()) {
                for (auto const& jf : snap.value("films", json::array())) {
                    auto f = std::make_shared<TFilm>(FilmFromJSON(jf));
                    Films[f->Id] = f;
                }
                for (auto const& jr : snap.value("rooms", json::array())) {
                    auto r = std::make_shared<TRoom>(RoomFromJSON(jr));
                    Rooms[r->Id] = r;
                }
                for (auto const& js : snap.value("sessions", json::array())) {
                    TSession s = SessionFromJSON(js);
                    Sessions.emplace(s.Id(), s);
                }
                Seq = SequenceOf(snap);
            }
            for (auto const& entry : Storage->ReadJournal()) {
                const uint64_t seq = SequenceOf(entry);
                if (seq <= Seq) {
                    continue;
                }
                Apply(entry);
                Seq = seq;
            }
        } catch (const json::exception& ex) {
            throw std::runtime_error(std::string("Malformed schedule data: ") + ex.what());
        } catch (const std::out_of_range& ex) {
            throw std::runtime_error(std::string("Schedule data out of range: ") + ex.what());
        }
    }

    json TSessionRepository::StateToJson() const {
        json snap = json::object();
        snap["seq"] = Seq;
        snap["films"] = json::array();
        for (auto const& kv : Films) {
            json j;
            ToJSON(j, *kv.second);
            snap["films"].push_back(j);
        }
        snap["rooms"] = json::array();
        for (auto const& kv : Rooms) {
            json j;
            ToJSON(j, *kv.second);
            snap["rooms"].push_back(j);
        }
        snap["sessions"] = json::array();
        for (auto const& kv : Sessions) {
            json j;
            ToJSON(j, kv.second);
            snap["sessions"].push_back(j);
        }
        return snap;
    }

} // namespace NScreening

#include <Config.hpp>
#include <FileJsonStorage.hpp>
#include <ScheduleManager.hpp>
#include <TimeOfDay.hpp>

#include <iostream>
#include <sstream>
#include <memory>

using namespace NScreening;

namespace {

    std::shared_ptr<IStorage> MakeStorage(const TAppConfig& cfg) {
        if (cfg.InMemory) {
            return std::make_shared<TMemoryStorage>();
        }
        return std::make_shared<TFileJsonStorage>(cfg.SnapshotPath, cfg.JournalPath);
    }

    void PrintSession(const TSession& s) {
        std::cout << "id=" << s.Id() << " film=\"" << s.Film().Name << "\" start=" << FormatTimePoint(s.Start())
                  << " end=" << FormatTimePoint(s.End()) << " price=" << FormatMoney(s.Price()) << "\n";
    }

} // namespace

int main(int argc, char** argv) {
    TAppConfig cfg;
    std::unique_ptr<TScheduleManager> mgrHolder;
    try {
        cfg = LoadConfig(argc > 1 ? argv[1] : "screening.json");
        auto storage = MakeStorage(cfg);
        auto repo = std::make_shared<TSessionRepository>(storage);
        mgrHolder = std::make_unique<TScheduleManager>(repo);
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }
    TScheduleManager& mgr = *mgrHolder;

    if (cfg.InMemory) {
        std::cerr << "Running in memory, nothing will be saved\n";
    } else {
        std::cerr << "Schedule checkpoint: " << cfg.SnapshotPath.string() << ", journal: " << cfg.JournalPath.string() << "\n";
    }

    std::cout << "Screening scheduler. Commands:\n"
              << "  film <name (no-spaces)> <minutes> <genre> <price>\n"
              << "  room <name (no-spaces)> <price>\n"
              << "  films\n"
              << "  rooms\n"
              << "  add <room> <film> <YYYY-MM-DD> <HH:MM>\n"
              << "  check <room> <film> <YYYY-MM-DD> <HH:MM>\n"
              << "  list <room>\n"
              << "  remove <session>\n"
              << "  ticket <session> <Full|Student|Bank> <seat, e.g. B7>\n"
              << "  save\n"
              << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "film") {
                std::string name;
                long long minutes;
                std::string genre;
                std::string price;
                iss >> name >> minutes >> genre >> price;
                if (!iss) {
                    std::cout << "Usage: film <name> <minutes> <genre> <price>\n";
                    continue;
                }
                auto id = mgr.RegisterFilm(TFilm(0, name, TMinutes(minutes), genre, ParseMoney(price)));
                std::cout << "Registered film with id=" << id << "\n";
                continue;
            }

            if (cmd == "room") {
                std::string name;
                std::string price;
                iss >> name >> price;
                if (!iss) {
                    std::cout << "Usage: room <name> <price>\n";
                    continue;
                }
                auto id = mgr.RegisterRoom(TRoom(0, name, ParseMoney(price)));
                std::cout << "Registered room with id=" << id << "\n";
                continue;
            }

            if (cmd == "films") {
                for (auto const& f : mgr.ListFilms()) {
                    std::cout << "id=" << f->Id << " name=\"" << f->Name << "\" duration=" << f->Duration.count()
                              << "min genre=" << f->Genre << " price=" << FormatMoney(f->Price) << "\n";
                }
                continue;
            }

            if (cmd == "rooms") {
                for (auto const& r : mgr.ListRooms()) {
                    std::cout << "id=" << r->Id << " name=\"" << r->Name << "\" price=" << FormatMoney(r->Price) << "\n";
                }
                continue;
            }

            if (cmd == "add" || cmd == "check") {
                RoomId room;
                FilmId film;
                std::string date;
                std::string time;
                iss >> room >> film >> date >> time;
                if (!iss) {
                    std::cout << "Usage: " << cmd << " <room> <film> <YYYY-MM-DD> <HH:MM>\n";
                    continue;
                }
                TTimePoint start = TTimeOfDay::Parse(time).At(ParseDate(date));
                if (cmd == "check") {
                    auto conflict = mgr.CheckSession(room, film, start);
                    if (conflict) {
                        std::cout << "Does not fit, overlaps " << conflict->Describe() << "\n";
                    } else {
                        std::cout << "Fits\n";
                    }
                    continue;
                }
                auto id = mgr.AddSession(room, film, start);
                if (id) {
                    std::cout << "Created session with id=" << *id << "\n";
                } else {
                    std::cout << "Create failed (overlaps an existing session)\n";
                }
                continue;
            }

            if (cmd == "list") {
                RoomId room;
                iss >> room;
                if (!iss) {
                    std::cout << "Usage: list <room>\n";
                    continue;
                }
                for (auto const& s : mgr.ListSessions(room)) {
                    PrintSession(s);
                }
                continue;
            }

            if (cmd == "save") {
                mgr.Checkpoint();
                std::cout << "Saved\n";
                continue;
            }

            if (cmd == "remove") {
                SessionId id;
                iss >> id;
                if (!iss) {
                    std::cout << "Usage: remove <session>\n";
                    continue;
                }
                bool ok = mgr.RemoveSession(id);
                std::cout << (ok ? "Removed" : "Not found") << " id=" << id << "\n";
                continue;
            }

            if (cmd == "ticket") {
                SessionId id;
                std::string type;
                std::string seat;
                iss >> id >> type >> seat;
                if (!iss) {
                    std::cout << "Usage: ticket <session> <Full|Student|Bank> <seat>\n";
                    continue;
                }
                auto t = mgr.IssueTicket(id, ParseTicketType(type), ParseSeat(seat));
                std::cout << "Ticket session=" << t.Session << " seat=" << ToString(t.Seat) << " type=" << ToString(t.Type)
                          << " price=" << FormatMoney(t.Price) << "\n";
                continue;
            }

            std::cout << "Unknown command\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    try {
        mgr.Checkpoint();
    } catch (const std::exception& ex) {
        std::cerr << "Checkpoint failed, changes stay in the journal: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}

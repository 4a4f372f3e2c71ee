#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

using SessionId = uint64_t;
using RoomId = uint64_t;
using FilmId = uint64_t;

// Prices are kept in cents.
using TMoney = int64_t;

// Naive date-time, no timezone attached.
using TTimePoint = std::chrono::system_clock::time_point;
using TMinutes = std::chrono::minutes;

namespace NScreening {

    // Longest film accepted; keeps start + duration well inside TTimePoint.
    constexpr TMinutes MAX_FILM_DURATION = std::chrono::hours(24);

    struct TFilm {
        FilmId Id = 0;
        std::string Name;
        TMinutes Duration{0};
        std::string Genre;
        TMoney Price = 0;

        TFilm() = default;
        TFilm(FilmId id, std::string name, TMinutes duration, std::string genre, TMoney price)
            : Id(id)
            , Name(std::move(name))
            , Duration(duration)
            , Genre(std::move(genre))
            , Price(price) {
            if (Duration.count() < 0) {
                throw std::invalid_argument("Film duration must not be negative: " + Name);
            }
            if (Duration > MAX_FILM_DURATION) {
                throw std::invalid_argument("Film longer than " + std::to_string(MAX_FILM_DURATION.count()) +
                                            " minutes: " + Name);
            }
            if (Price < 0) {
                throw std::invalid_argument("Film price must not be negative: " + Name);
            }
        }
    };

    struct TRoom {
        RoomId Id = 0;
        std::string Name;
        TMoney Price = 0;

        TRoom() = default;
        TRoom(RoomId id, std::string name, TMoney price)
            : Id(id)
            , Name(std::move(name))
            , Price(price) {
            if (Price < 0) {
                throw std::invalid_argument("Room price must not be negative: " + Name);
            }
        }
    };

    using TFilmPtr = std::shared_ptr<const TFilm>;
    using TRoomPtr = std::shared_ptr<const TRoom>;

    inline long long ToEpochSeconds(TTimePoint tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    // TTimePoint counts nanoseconds and spans roughly 1678..2262. Three days are
    // kept in reserve so a day start plus a time of day plus the longest film
    // never overflows.
    constexpr long long MAX_EPOCH_SECONDS =
        std::chrono::duration_cast<std::chrono::seconds>(TTimePoint::duration::max()).count() - 3 * 24 * 60 * 60;

    inline TTimePoint FromEpochSeconds(long long s) {
        if (s > MAX_EPOCH_SECONDS || s < -MAX_EPOCH_SECONDS) {
            throw std::out_of_range("Time outside the supported range: " + std::to_string(s) + "s since epoch");
        }
        return TTimePoint(std::chrono::seconds(s));
    }

    inline void ToJSON(json& j, TFilm const& f) {
        j = json{{"id", f.Id}, {"name", f.Name}, {"duration_min", f.Duration.count()}, {"genre", f.Genre}, {"price", f.Price}};
    }

    inline TFilm FilmFromJSON(json const& j) {
        return TFilm(j.at("id").get<FilmId>(),
                     j.at("name").get<std::string>(),
                     TMinutes(j.at("duration_min").get<long long>()),
                     j.value("genre", ""),
                     j.value("price", TMoney{0}));
    }

    inline void ToJSON(json& j, TRoom const& r) {
        j = json{{"id", r.Id}, {"name", r.Name}, {"price", r.Price}};
    }

    inline TRoom RoomFromJSON(json const& j) {
        return TRoom(j.at("id").get<RoomId>(),
                     j.at("name").get<std::string>(),
                     j.value("price", TMoney{0}));
    }

    inline bool IntervalsOverlap(const TTimePoint& a_start,
                                 const TTimePoint& a_end,
                                 const TTimePoint& b_start,
                                 const TTimePoint& b_end) {
        return !(a_end <= b_start || a_start >= b_end);
    }

} // namespace NScreening

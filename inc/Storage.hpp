#pragma once
#include <algorithm>
#include <mutex>
#include <vector>

#include "common.hpp"

namespace NScreening {

    // Every journal entry and checkpoint carries a "seq" number. A change is
    // committed once AppendJournal() returns; a checkpoint holds the whole
    // state up to its "seq" and replaces the journal entries it covers.
    struct IStorage {
        virtual ~IStorage() = default;
        virtual void AppendJournal(const json& entry) = 0;
        virtual std::vector<json> ReadJournal() = 0;
        virtual void WriteCheckpoint(const json& state) = 0;
        virtual json ReadCheckpoint() = 0;
    };

    inline uint64_t SequenceOf(const json& doc) {
        if (!doc.is_object()) {
            return 0;
        }
        return doc.value("seq", uint64_t{0});
    }

    class TMemoryStorage: public IStorage {
    public:
        TMemoryStorage() = default;

        void AppendJournal(const json& entry) override {
            std::scoped_lock lk(Mutex_);
            Journal.push_back(entry);
        }

        std::vector<json> ReadJournal() override {
            std::scoped_lock lk(Mutex_);
            return Journal;
        }

        void WriteCheckpoint(const json& state) override {
            std::scoped_lock lk(Mutex_);
            Checkpoint = state;
            const uint64_t covered = SequenceOf(state);
            Journal.erase(std::remove_if(Journal.begin(), Journal.end(),
                                         [covered](const json& e) {
                                             return SequenceOf(e) <= covered;
                                         }),
                          Journal.end());
        }

        json ReadCheckpoint() override {
            std::scoped_lock lk(Mutex_);
            return Checkpoint;
        }

    private:
        json Checkpoint = json::object();
        std::vector<json> Journal;
        std::mutex Mutex_;
    };

} // namespace NScreening

#pragma once
#include "Storage.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace NScreening {

    // Checkpoint is a pretty-printed JSON file replaced atomically (temp file +
    // rename). The journal holds one JSON entry per line; a checkpoint rewrites
    // it, again atomically, keeping only the entries newer than itself.
    class TFileJsonStorage: public IStorage {
    public:
        TFileJsonStorage(std::filesystem::path checkpointPath, std::filesystem::path journalPath);

        void AppendJournal(const json& entry) override;
        std::vector<json> ReadJournal() override;
        void WriteCheckpoint(const json& state) override;
        json ReadCheckpoint() override;

    private:
        std::vector<json> ReadJournalLocked() const;
        static void EnsureParent(const std::filesystem::path& path);
        static void AtomicWrite(const std::filesystem::path& path, const std::string& content);

    private:
        std::filesystem::path CheckpointPath;
        std::filesystem::path JournalPath;
        std::mutex Mutex_;
    };

} // namespace NScreening

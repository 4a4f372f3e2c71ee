#pragma once
#include <filesystem>

#include "common.hpp"

namespace NScreening {

    struct TAppConfig {
        std::filesystem::path SnapshotPath = "data/schedule.json";
        std::filesystem::path JournalPath = "data/journal.jsonl";
        // Keep everything in memory, nothing touches the disk.
        bool InMemory = false;
    };

    // A missing file gives the defaults; unreadable or malformed JSON throws
    // std::runtime_error. Unknown keys are ignored.
    TAppConfig LoadConfig(const std::filesystem::path& path);

    TAppConfig ConfigFromJson(const json& j);

} // namespace NScreening

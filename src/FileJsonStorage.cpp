#include <FileJsonStorage.hpp>

#include <fstream>
#include <system_error>

namespace NScreening {

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path checkpointPath, std::filesystem::path journalPath)
        : CheckpointPath(std::move(checkpointPath))
        , JournalPath(std::move(journalPath)) {
    }

    void TFileJsonStorage::EnsureParent(const std::filesystem::path& path) {
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const std::string& content) {
        auto tmp = path;
        tmp += ".tmp";

        {
            std::ofstream ofs(tmp, std::ios::trunc);
            if (!ofs) {
                throw std::runtime_error("Cannot open temp file for writing: " + tmp.string());
            }
            ofs << content;
            ofs.flush();
            if (!ofs) {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                throw std::runtime_error("Write failed: " + tmp.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("Atomic rename to " + path.string() + " failed: " + ec.message());
        }
    }

    void TFileJsonStorage::AppendJournal(const json& entry) {
        std::scoped_lock lk(Mutex_);
        EnsureParent(JournalPath);
        std::ofstream ofs(JournalPath, std::ios::app);
        if (!ofs) {
            throw std::runtime_error("Cannot open journal file for append: " + JournalPath.string());
        }
        ofs << entry.dump() << '\n';
        ofs.flush();
        if (!ofs) {
            throw std::runtime_error("Journal append failed: " + JournalPath.string());
        }
    }

    std::vector<json> TFileJsonStorage::ReadJournalLocked() const {
        std::vector<json> out;
        if (!std::filesystem::exists(JournalPath)) {
            return out;
        }
        std::ifstream ifs(JournalPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open journal: " + JournalPath.string());
        }
        std::string line;
        size_t lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                out.push_back(json::parse(line));
            } catch (const json::parse_error& ex) {
                throw std::runtime_error("Corrupt journal line " + std::to_string(lineNo) + " in " +
                                         JournalPath.string() + ": " + ex.what());
            }
        }
        return out;
    }

    std::vector<json> TFileJsonStorage::ReadJournal() {
        std::scoped_lock lk(Mutex_);
        return ReadJournalLocked();
    }

    void TFileJsonStorage::WriteCheckpoint(const json& state) {
        std::scoped_lock lk(Mutex_);
        EnsureParent(CheckpointPath);
        AtomicWrite(CheckpointPath, state.dump(2));

        // Entries up to the checkpoint are now redundant. If this rewrite fails
        // the reader still skips them by sequence number.
        const uint64_t covered = SequenceOf(state);
        std::string rest;
        for (auto const& e : ReadJournalLocked()) {
            if (SequenceOf(e) > covered) {
                rest += e.dump();
                rest += '\n';
            }
        }
        EnsureParent(JournalPath);
        AtomicWrite(JournalPath, rest);
    }

    json TFileJsonStorage::ReadCheckpoint() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(CheckpointPath)) {
            return json::object();
        }
        std::ifstream ifs(CheckpointPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open checkpoint: " + CheckpointPath.string());
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& ex) {
            throw std::runtime_error("Corrupt checkpoint " + CheckpointPath.string() + ": " + ex.what());
        }
    }

} // namespace NScreening

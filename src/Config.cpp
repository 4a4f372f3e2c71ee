#include <Config.hpp>

#include <fstream>

namespace NScreening {

    TAppConfig ConfigFromJson(const json& j) {
        TAppConfig cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config must be a JSON object");
        }
        try {
            if (j.contains("snapshot_path")) {
                cfg.SnapshotPath = j.at("snapshot_path").get<std::string>();
            }
            if (j.contains("journal_path")) {
                cfg.JournalPath = j.at("journal_path").get<std::string>();
            }
            cfg.InMemory = j.value("in_memory", cfg.InMemory);
        } catch (const json::type_error& ex) {
            throw std::runtime_error(std::string("Bad config value: ") + ex.what());
        }
        return cfg;
    }

    TAppConfig LoadConfig(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return TAppConfig{};
        }
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& ex) {
            throw std::runtime_error("Cannot parse config file " + path.string() + ": " + ex.what());
        }
        return ConfigFromJson(j);
    }

} // namespace NScreening

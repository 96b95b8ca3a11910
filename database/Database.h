#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

// One JSON document on disk, always read and written whole.
class Database {
public:
    Database(const std::string& file);

    bool exists() const;

    // nullopt when the file does not exist; throws on unreadable or malformed content
    std::optional<nlohmann::json> read() const;
    void write(const nlohmann::json& document);

    const std::string& get_path() const { return path; }

private:
    std::string path;
};

#include "Database.h"

#include <fstream>
#include <filesystem>
#include <system_error>

Database::Database(const std::string& file)
    : path(file)
{
    if (path.empty()) {
        throw std::runtime_error("Database file name is empty");
    }
}

bool Database::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<nlohmann::json> Database::read() const {
    if (!exists())
        return std::nullopt;

    std::ifstream infile(path);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open " + path + " for reading");
    }

    try {
        return nlohmann::json::parse(infile);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Corrupt JSON in " + path + ": " + ex.what());
    }
}

void Database::write(const nlohmann::json& document) {
    std::string tmp_path = path + ".tmp";

    {
        std::ofstream outfile(tmp_path, std::ios::trunc);
        if (!outfile.is_open()) {
            throw std::runtime_error("Failed to open " + tmp_path + " for writing");
        }

        outfile << document.dump(2) << "\n";
        outfile.flush();
        if (!outfile) {
            throw std::runtime_error("Failed to write " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::string error = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Failed to replace " + path + ": " + error);
    }
}

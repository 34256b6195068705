#include <revise/backup.hpp>
#include <revise/log.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace revise {

namespace fs = std::filesystem;

std::string backup_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t secs = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H-%M-%S") << '-'
       << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

static bool safe_file_component(const std::string& s) {
    if (s.empty()) return false;
    if (s.find('/') != std::string::npos || s.find('\\') != std::string::npos) {
        return false;
    }
    return s.find("..") == std::string::npos;
}

Result<std::string> write_backup(const std::string& template_id,
                                 const Document& doc,
                                 const std::string& dir) {
    if (!safe_file_component(template_id)) {
        return ReviseError{ReviseError::InvalidArg,
            "template id '" + template_id + "' cannot be used in a backup file name",
            "template ids must not be empty or contain path separators or '..'"};
    }

    // Serialize before touching the filesystem
    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        return ReviseError{ReviseError::IO,
            "cannot serialize backup of '" + template_id + "': " + e.what()};
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return ReviseError{ReviseError::IO,
            "cannot create backup directory '" + dir + "': " + ec.message()};
    }

    fs::path path = fs::path(dir) / (template_id + "_" + backup_timestamp() + "_backup.json");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ReviseError{ReviseError::IO,
            "cannot open backup file for writing: " + path.string()};
    }
    out << text;
    out.close();
    if (!out) {
        return ReviseError{ReviseError::IO,
            "failed to write backup file: " + path.string()};
    }

    log::info("backed up %s to %s", template_id.c_str(), path.string().c_str());
    return Result<std::string>::ok(path.string());
}

Result<Document> read_backup(const std::string& path, std::uintmax_t max_bytes) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return ReviseError{ReviseError::Rollback,
            "Rollback failed: cannot read backup '" + path + "': " + ec.message()};
    }
    if (size > max_bytes) {
        return ReviseError{ReviseError::Rollback,
            "Rollback failed: backup '" + path + "' is " + std::to_string(size) +
            " bytes, limit is " + std::to_string(max_bytes)};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ReviseError{ReviseError::Rollback,
            "Rollback failed: cannot open backup '" + path + "'"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    try {
        return Result<Document>::ok(Document::parse(ss.str()));
    } catch (const nlohmann::json::exception& e) {
        return ReviseError{ReviseError::Rollback,
            std::string("Rollback failed: backup is not readable JSON: ") + e.what(),
            "", path, 0};
    }
}

} // namespace revise

#pragma once

#include <revise/result.hpp>
#include <revise/document.hpp>

#include <cstdint>
#include <string>

namespace revise {

constexpr std::uintmax_t kMaxBackupBytes = 2 * 1024 * 1024;

// Current UTC time as ISO-8601 with ':' and '.' replaced by '-',
// e.g. 2026-10-19T08-15-42-318Z
std::string backup_timestamp();

// Writes <dir>/<template_id>_<timestamp>_backup.json (2-space indented JSON),
// creating dir as needed. Returns the path written.
Result<std::string> write_backup(const std::string& template_id,
                                 const Document& doc,
                                 const std::string& dir);

// Reads a backup back. Missing, oversized or malformed files are reported
// as ReviseError::Rollback.
Result<Document> read_backup(const std::string& path,
                             std::uintmax_t max_bytes = kMaxBackupBytes);

} // namespace revise

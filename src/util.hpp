#pragma once
#include <string>
#include <cstdint>
#include <chrono>

namespace memcat {

// ISO 8601 UTC timestamp with microseconds, e.g. 2025-01-31T09:15:02.123456Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Compact form used for memory ids, e.g. 20250131091502123456
std::string format_compact_timestamp(int64_t epoch_micros);

// Microseconds since the Unix epoch
int64_t epoch_micros(std::chrono::system_clock::time_point tp);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case
std::string to_lower(const std::string& s);

// Lower-case ASCII plus the Latin-1 Supplement capitals (À-Þ, except ×)
// in UTF-8 input. Other bytes pass through untouched.
std::string utf8_to_lower(const std::string& s);

// Truncate to at most max_chars UTF-8 code points
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace memcat

#ifndef noclaw_CORE_UTILS_HPP
#define noclaw_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace noclaw {

// ============ Time utilities ============

// Monotonic clock in milliseconds (for elapsed-time measurement)
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Normalize path (resolve . and ..) without touching the filesystem
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Make a path absolute against the current working directory
std::string absolute_path(const std::string& path);

// Expand a leading "~" or "~/" to $HOME
std::string expand_home(const std::string& path);

// Create a directory and all missing parents (mode 0755)
bool ensure_directory(const std::string& path);

bool file_exists(const std::string& path);

// Read a whole file into `out`. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Create or truncate `path` with `content`
bool write_file(const std::string& path, const std::string& content);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace noclaw

#endif // noclaw_CORE_UTILS_HPP

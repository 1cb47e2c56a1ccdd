#ifndef dailies_CORE_UTILS_HPP
#define dailies_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace dailies {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Case-insensitive (ASCII) prefix test
bool istarts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter. A trailing delimiter yields a trailing empty part.
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace every occurrence of `from` with `to`
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Parse a base-10 integer covering the whole string. No sign, no whitespace.
bool parse_int64(const std::string& s, int64_t& out);

// ============ UTF-8 utilities ============

// Number of code points. Continuation bytes are not counted; stray
// continuation bytes therefore never start a character.
size_t utf8_length(const std::string& s);

// Well-formed UTF-8 (no overlongs, surrogates or truncated sequences)
bool is_valid_utf8(const std::string& s);

// First `max_chars` code points of `s`
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Shorten to at most `max_chars` code points; longer text keeps
// `max_chars - 3` code points followed by "...".
std::string truncate_display(const std::string& s, size_t max_chars);

// ============ File utilities ============

// Read a whole file. Returns false (and sets `error`) when it cannot be read.
bool read_file(const std::string& path, std::string& out, std::string& error);

// Write (truncate) a whole file, creating parent directories first.
bool write_file(const std::string& path, const std::string& content, std::string& error);

// Regular files directly inside `dir` whose name ends with `extension`,
// sorted by name. Returns false when the directory cannot be opened.
bool list_files(const std::string& dir, const std::string& extension,
                std::vector<std::string>& out, std::string& error);

bool is_directory(const std::string& path);

// Last path component ("a/b/2024-01-02.org" -> "2024-01-02.org")
std::string base_name(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create a directory and its parents (mkdir -p)
bool create_directories(const std::string& dir);

} // namespace dailies

#endif // dailies_CORE_UTILS_HPP

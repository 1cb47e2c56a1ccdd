#include <dailies/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>

namespace dailies {

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), s.rbegin());
}

bool istarts_with(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string out;
    out.reserve(s.size());
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(from, start)) != std::string::npos) {
        out.append(s, start, pos - start);
        out += to;
        start = pos + from.size();
    }
    out.append(s, start, std::string::npos);
    return out;
}

bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    int64_t value = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        int digit = s[i] - '0';
        if (value > (INT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

// ============ UTF-8 utilities ============

static inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) ++count;
    }
    return count;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t expected;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            expected = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + expected > s.size()) return false;
        for (size_t j = 1; j < expected; ++j) {
            unsigned char cc = static_cast<unsigned char>(s[i + j]);
            if (!is_continuation(cc)) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((expected == 2 && cp < 0x80) ||
            (expected == 3 && cp < 0x800) ||
            (expected == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += expected;
    }
    return true;
}

std::string utf8_prefix(const std::string& s, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) {
            if (count == max_chars) return s.substr(0, i);
            ++count;
        }
    }
    return s;
}

std::string truncate_display(const std::string& s, size_t max_chars) {
    if (utf8_length(s) <= max_chars) return s;
    if (max_chars <= 3) return utf8_prefix(s, max_chars);
    return utf8_prefix(s, max_chars - 3) + "...";
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out, std::string& error) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) {
        error = "cannot open '" + path + "': " + std::strerror(errno);
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        error = "read error on '" + path + "'";
        return false;
    }
    out = oss.str();
    return true;
}

bool write_file(const std::string& path, const std::string& content, std::string& error) {
    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0 && !create_directories(path.substr(0, slash))) {
        error = "cannot create parent directory of '" + path + "': " + std::strerror(errno);
        return false;
    }
    std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open '" + path + "' for writing: " + std::strerror(errno);
        return false;
    }
    out << content;
    out.flush();
    if (!out) {
        error = "write error on '" + path + "'";
        return false;
    }
    return true;
}

bool list_files(const std::string& dir, const std::string& extension,
                std::vector<std::string>& out, std::string& error) {
    DIR* d = opendir(dir.c_str());
    if (!d) {
        error = "cannot open directory '" + dir + "': " + std::strerror(errno);
        return false;
    }

    std::vector<std::string> names;
    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        if (!ends_with(name, extension)) continue;

        struct stat st;
        std::string full = join_path(dir, name);
        if (stat(full.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            names.push_back(name);
        }
    }
    closedir(d);

    std::sort(names.begin(), names.end());
    out.clear();
    for (size_t i = 0; i < names.size(); ++i) {
        out.push_back(join_path(dir, names[i]));
    }
    return true;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string base_name(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

bool create_directories(const std::string& dir) {
    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace dailies

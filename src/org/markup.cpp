#include <dailies/org/markup.hpp>
#include <dailies/core/utils.hpp>
#include <vector>
#include <cstddef>

namespace dailies {

namespace {

const char* const kVerbatimBlocks[] = { "src", "quote", "example" };

bool is_blank_char(char c) {
    return c == ' ' || c == '\t';
}

// "#+begin_src python" -> "src" for the verbatim block kinds, "" otherwise
std::string block_kind(const std::string& trimmed) {
    for (size_t i = 0; i < sizeof(kVerbatimBlocks) / sizeof(kVerbatimBlocks[0]); ++i) {
        std::string tag = std::string("#+begin_") + kVerbatimBlocks[i];
        if (istarts_with(trimmed, tag) &&
            (trimmed.size() == tag.size() || is_blank_char(trimmed[tag.size()]))) {
            return kVerbatimBlocks[i];
        }
    }
    return "";
}

bool is_block_end(const std::string& trimmed, const std::string& kind) {
    return istarts_with(trimmed, "#+end_" + kind);
}

// Index of the line closing a block/drawer opened at `open`, or npos
size_t find_closing_line(const std::vector<std::string>& lines, size_t open,
                         const std::string& kind) {
    for (size_t j = open + 1; j < lines.size(); ++j) {
        std::string t = trim(lines[j]);
        if (kind.empty() ? (t == ":END:") : is_block_end(t, kind)) {
            return j;
        }
    }
    return std::string::npos;
}

bool is_transcript_label(const std::string& trimmed) {
    return trimmed == "Question:" || trimmed == "AI Response:";
}

// "** Heading" -> "Heading"
std::string strip_heading_stars(const std::string& line) {
    size_t stars = 0;
    while (stars < line.size() && line[stars] == '*') ++stars;
    if (stars == 0 || stars >= line.size() || !is_blank_char(line[stars])) {
        return line;
    }
    size_t text = stars;
    while (text < line.size() && is_blank_char(line[text])) ++text;
    return line.substr(text);
}

// Lines are scanned by hand: std::regex recurses per character and a
// single long line would exhaust the stack.

bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

bool is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

// [[target][text]] -> text, [[target]] -> target
std::string replace_org_links(const std::string& line) {
    std::string out;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t open = line.find("[[", pos);
        if (open == std::string::npos) break;
        size_t close = line.find(']', open + 2);
        if (close == std::string::npos) break;

        size_t after = close + 1;
        size_t end = std::string::npos;
        std::string display;
        if (after < line.size() && line[after] == ']') {
            display = line.substr(open + 2, close - open - 2);
            end = after + 1;
        } else if (after < line.size() && line[after] == '[') {
            size_t text_close = line.find(']', after + 1);
            if (text_close != std::string::npos && text_close + 1 < line.size() &&
                line[text_close + 1] == ']') {
                display = line.substr(after + 1, text_close - after - 1);
                end = text_close + 2;
            }
        }

        if (end == std::string::npos) {
            out.append(line, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }
        out.append(line, pos, open - pos);
        out += display;
        pos = end;
    }
    out.append(line, pos, std::string::npos);
    return out;
}

// Drops "@user" / "@assistant" and the whitespace after them
std::string remove_role_markers(const std::string& line) {
    static const char* const kRoles[] = { "user", "assistant" };

    std::string out;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t at = line.find('@', pos);
        if (at == std::string::npos) break;

        size_t end = std::string::npos;
        if (at == 0 || !is_word_char(line[at - 1])) {
            for (size_t r = 0; r < 2; ++r) {
                std::string role = kRoles[r];
                size_t word_end = at + 1 + role.size();
                if (line.compare(at + 1, role.size(), role) == 0 &&
                    (word_end == line.size() || !is_word_char(line[word_end]))) {
                    end = word_end;
                    break;
                }
            }
        }

        out.append(line, pos, at - pos);
        if (end == std::string::npos) {
            out += '@';
            pos = at + 1;
            continue;
        }
        while (end < line.size() && is_space_char(line[end])) ++end;
        pos = end;
    }
    out.append(line, pos, std::string::npos);
    return out;
}

std::string strip_inline(const std::string& line) {
    return remove_role_markers(replace_org_links(line));
}

// "### Title" -> level 3 and "Title"; false when the line is no heading
bool match_markdown_heading(const std::string& line, size_t& level, std::string& text) {
    size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#') ++hashes;
    if (hashes == 0 || hashes > 6 || hashes >= line.size() || !is_space_char(line[hashes])) {
        return false;
    }
    size_t start = hashes;
    while (start < line.size() && is_space_char(line[start])) ++start;
    level = hashes;
    text = line.substr(start);
    return true;
}

// Replaces each `open`...`close` pair whose inner text is non-empty
std::string replace_delimited(const std::string& line, const std::string& open,
                              const std::string& close, const std::string& before,
                              const std::string& after) {
    std::string out;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find(open, pos);
        if (start == std::string::npos) break;
        size_t inner = start + open.size();
        size_t stop = line.find(close, inner);
        if (stop == std::string::npos) break;
        if (stop == inner) {
            out.append(line, pos, start + 1 - pos);
            pos = start + 1;
            continue;
        }
        out.append(line, pos, start - pos);
        out += before;
        out.append(line, inner, stop - inner);
        out += after;
        pos = stop + close.size();
    }
    out.append(line, pos, std::string::npos);
    return out;
}

// ![alt](url) -> [[url]] when `image`, [label](url) -> [[url][label]] otherwise
std::string replace_markdown_links(const std::string& line, bool image) {
    const std::string open = image ? "![" : "[";
    std::string out;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find(open, pos);
        if (start == std::string::npos) break;
        size_t label = start + open.size();
        size_t label_end = line.find(']', label);
        if (label_end == std::string::npos) break;

        size_t url_end = std::string::npos;
        bool label_ok = image || label_end > label;
        if (label_ok && label_end + 1 < line.size() && line[label_end + 1] == '(') {
            url_end = line.find(')', label_end + 2);
            if (url_end == label_end + 2) url_end = std::string::npos;
        }

        if (url_end == std::string::npos) {
            out.append(line, pos, start + 1 - pos);
            pos = start + 1;
            continue;
        }
        std::string url = line.substr(label_end + 2, url_end - label_end - 2);
        out.append(line, pos, start - pos);
        if (image) {
            out += "[[" + url + "]]";
        } else {
            out += "[[" + url + "][" + line.substr(label, label_end - label) + "]]";
        }
        pos = url_end + 1;
    }
    out.append(line, pos, std::string::npos);
    return out;
}

} // anonymous namespace

std::string collapse_blank_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t run = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++run;
            if (run <= 2) out += '\n';
        } else {
            run = 0;
            out += text[i];
        }
    }
    return out;
}

std::string strip_org_markup(const std::string& text) {
    std::vector<std::string> lines = split(text, '\n');
    std::vector<std::string> kept;
    kept.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        std::string t = trim(line);

        if (t == ":PROPERTIES:") {
            size_t close = find_closing_line(lines, i, "");
            if (close != std::string::npos) {
                i = close;
                continue;
            }
        }

        std::string kind = block_kind(t);
        if (!kind.empty()) {
            size_t close = find_closing_line(lines, i, kind);
            if (close != std::string::npos) {
                kept.insert(kept.end(), lines.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                            lines.begin() + static_cast<std::ptrdiff_t>(close));
                i = close;
                continue;
            }
        }

        // Other directives, #+RESULTS: and unmatched block delimiters
        if (starts_with(t, "#+")) continue;
        if (is_transcript_label(t)) continue;

        std::string stripped = strip_inline(strip_heading_stars(line));
        if (trim(stripped).empty() && !t.empty()) {
            // the line held nothing but markup
            continue;
        }
        kept.push_back(stripped);
    }

    return trim(collapse_blank_lines(join(kept, "\n")));
}

std::string markdown_to_org(const std::string& markdown, int heading_offset) {
    std::vector<std::string> lines = split(markdown, '\n');
    std::vector<std::string> result;
    result.reserve(lines.size());
    bool in_code_block = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        std::string stripped = trim(line);

        if (starts_with(stripped, "```")) {
            if (in_code_block) {
                result.push_back("#+end_src");
                in_code_block = false;
            } else {
                std::string lang = trim(stripped.substr(3));
                result.push_back(lang.empty() ? "#+begin_src" : "#+begin_src " + lang);
                in_code_block = true;
            }
            continue;
        }

        if (in_code_block) {
            result.push_back(line);
            continue;
        }

        size_t hashes = 0;
        std::string title;
        if (match_markdown_heading(line, hashes, title)) {
            int level = static_cast<int>(hashes) + heading_offset;
            if (level < 1) level = 1;
            result.push_back(std::string(static_cast<size_t>(level), '*') + " " + title);
            continue;
        }

        line = replace_delimited(line, "`", "`", "~", "~");
        line = replace_delimited(line, "**", "**", "*", "*");
        line = replace_markdown_links(line, true);
        line = replace_markdown_links(line, false);
        result.push_back(line);
    }

    return join(result, "\n");
}

std::string escape_org_headlines(const std::string& text) {
    std::vector<std::string> lines = split(text, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        if (starts_with(lines[i], "* ")) {
            lines[i][0] = '-';
        }
    }
    return join(lines, "\n");
}

} // namespace dailies

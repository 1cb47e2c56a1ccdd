#include <dailies/org/properties.hpp>
#include <dailies/core/utils.hpp>

namespace dailies {

namespace props {
const char* const MODEL = "GPTEL_MODEL";
const char* const BACKEND = "GPTEL_BACKEND";
const char* const SYSTEM = "GPTEL_SYSTEM";
const char* const BOUNDS = "GPTEL_BOUNDS";
const char* const TOPIC = "GPTEL_TOPIC";
}

namespace {

const std::string kOpenTag = ":PROPERTIES:";
const std::string kCloseTag = ":END:";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// ":NAME: value" -> {NAME, value}
bool parse_entry(const std::string& raw_line, std::pair<std::string, std::string>& out) {
    std::string line = trim(raw_line);
    if (line.size() < 2 || line[0] != ':') return false;
    size_t second = line.find(':', 1);
    if (second == std::string::npos) return false;
    out.first = line.substr(1, second - 1);
    out.second = trim(line.substr(second + 1));
    return !out.first.empty();
}

} // anonymous namespace

std::string PropertyBlock::get(const std::string& name, const std::string& default_val) const {
    for (size_t i = entries.size(); i > 0; --i) {
        if (entries[i - 1].first == name) return entries[i - 1].second;
    }
    return default_val;
}

bool PropertyBlock::has(const std::string& name) const {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].first == name) return true;
    }
    return false;
}

PropertyBlock find_property_block(const std::string& text, size_t from) {
    PropertyBlock block;

    size_t open = text.find(kOpenTag, from);
    while (open != std::string::npos) {
        // The whitespace run after the tag must contain a line break; the
        // body starts after the last one.
        size_t pos = open + kOpenTag.size();
        size_t body = std::string::npos;
        while (pos < text.size() && is_space(text[pos])) {
            if (text[pos] == '\n') body = pos + 1;
            ++pos;
        }
        if (body == std::string::npos) {
            open = text.find(kOpenTag, open + 1);
            continue;
        }

        size_t close = text.find(kCloseTag, body);
        if (close == std::string::npos) {
            return block;
        }

        block.found = true;
        block.begin = open;
        block.end = close + kCloseTag.size();

        std::vector<std::string> lines = split(text.substr(body, close - body), '\n');
        for (size_t i = 0; i < lines.size(); ++i) {
            std::pair<std::string, std::string> entry;
            if (parse_entry(lines[i], entry)) {
                block.entries.push_back(entry);
            }
        }
        return block;
    }
    return block;
}

GptelProperties read_gptel_properties(const PropertyBlock& block) {
    GptelProperties p;
    if (!block.found) return p;

    p.model = block.get(props::MODEL);
    p.backend = block.get(props::BACKEND);
    p.system = block.get(props::SYSTEM);
    p.topic = block.get(props::TOPIC);
    p.bounds_raw = block.get(props::BOUNDS);
    p.bounds = decode_bounds(p.bounds_raw);
    return p;
}

std::string render_property_block(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::string out = kOpenTag + "\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        out += ":" + entries[i].first + ": " + entries[i].second + "\n";
    }
    out += kCloseTag + "\n";
    return out;
}

} // namespace dailies

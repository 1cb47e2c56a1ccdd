#include <dailies/org/sections.hpp>
#include <dailies/org/properties.hpp>
#include <dailies/org/text_index.hpp>
#include <dailies/core/utils.hpp>
#include <dailies/core/logger.hpp>

namespace dailies {

std::vector<Section> find_top_level_sections(const std::string& document) {
    std::vector<Section> sections;
    std::vector<size_t> byte_starts;

    size_t line_start = 0;
    while (line_start < document.size()) {
        size_t line_end = document.find('\n', line_start);
        if (line_end == std::string::npos) line_end = document.size();

        // "* " plus at least one more character on the same line
        if (line_end - line_start > 2 &&
            document[line_start] == '*' && document[line_start + 1] == ' ') {
            Section s;
            s.title = trim(document.substr(line_start + 2, line_end - line_start - 2));
            sections.push_back(s);
            byte_starts.push_back(line_start);
        }
        line_start = line_end + 1;
    }

    if (sections.empty()) {
        return sections;
    }

    TextIndex index(document);
    for (size_t i = 0; i < sections.size(); ++i) {
        size_t byte_end = (i + 1 < sections.size()) ? byte_starts[i + 1] : document.size();
        sections[i].start_pos = index.char_at(byte_starts[i]);
        sections[i].end_pos = index.char_at(byte_end);

        std::string body = document.substr(byte_starts[i], byte_end - byte_starts[i]);
        PropertyBlock block = find_property_block(body);
        sections[i].topic = block.get(props::TOPIC);
    }

    LOG_DEBUG("[Sections] Found %zu top-level sections", sections.size());
    return sections;
}

std::vector<Bounds> filter_bounds_for_section(const std::vector<Bounds>& bounds,
                                              int64_t section_start, int64_t section_end) {
    std::vector<Bounds> out;
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (bounds[i].start >= section_start && bounds[i].end <= section_end) {
            out.push_back(bounds[i]);
        }
    }
    return out;
}

std::vector<Bounds> rebase_bounds(const std::vector<Bounds>& bounds, int64_t origin) {
    std::vector<Bounds> out;
    out.reserve(bounds.size());
    for (size_t i = 0; i < bounds.size(); ++i) {
        out.push_back(Bounds(bounds[i].start - origin, bounds[i].end - origin));
    }
    return out;
}

} // namespace dailies

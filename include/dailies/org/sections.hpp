/*
 * dailies C++17 - Top-level sections
 *
 * Each "* Heading" line opens a section that runs until the next one (or the
 * end of the buffer). Every section is parsed as its own conversation.
 */
#ifndef dailies_ORG_SECTIONS_HPP
#define dailies_ORG_SECTIONS_HPP

#include <dailies/org/bounds.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace dailies {

struct Section {
    std::string title;
    int64_t start_pos;      // character offset of the heading line
    int64_t end_pos;        // next section's start_pos, or buffer length
    std::string topic;      // GPTEL_TOPIC of the section's drawer, may be empty

    Section() : start_pos(0), end_pos(0) {}

    // Topic if the drawer names one, else the heading text
    const std::string& label() const { return topic.empty() ? title : topic; }
};

// Lines of the form "* text". "** text" and "*text" do not open sections.
std::vector<Section> find_top_level_sections(const std::string& document);

// Markers lying entirely inside [section_start, section_end). A marker that
// straddles a boundary belongs to no section and is dropped.
std::vector<Bounds> filter_bounds_for_section(const std::vector<Bounds>& bounds,
                                              int64_t section_start, int64_t section_end);

// Shift markers so they are relative to `origin`
std::vector<Bounds> rebase_bounds(const std::vector<Bounds>& bounds, int64_t origin);

} // namespace dailies

#endif // dailies_ORG_SECTIONS_HPP

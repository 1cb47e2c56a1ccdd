/*
 * dailies C++17 - Section splitting tests
 */
#include <dailies/org/sections.hpp>

#include <cassert>
#include <string>
#include <vector>

using namespace dailies;

void TestFindSections() {
    const std::string doc =
        "intro\n"
        "* First\n"
        "body\n"
        "** Sub\n"
        "*not a heading\n"
        "* \n"
        "* Second\n"
        "more\n";

    std::vector<Section> sections = find_top_level_sections(doc);
    assert(sections.size() == 2);
    assert(sections[0].title == "First");
    assert(sections[0].start_pos == static_cast<int64_t>(doc.find("* First")));
    assert(sections[0].end_pos == static_cast<int64_t>(doc.find("* Second")));
    assert(sections[1].title == "Second");
    assert(sections[1].start_pos == sections[0].end_pos);
    assert(sections[1].end_pos == static_cast<int64_t>(doc.size()));
}

void TestNoSections() {
    assert(find_top_level_sections("").empty());
    assert(find_top_level_sections("plain text\n** only sub\n").empty());
}

void TestTopicFromDrawer() {
    const std::string doc =
        "* Heading A\n"
        ":PROPERTIES:\n"
        ":GPTEL_TOPIC: Topic A\n"
        ":END:\n"
        "text\n"
        "* Heading B\n"
        "text\n"
        "* Heading C\n"
        ":PROPERTIES:\n"
        ":GPTEL_TOPIC: Topic C\n"
        ":END:\n";

    std::vector<Section> sections = find_top_level_sections(doc);
    assert(sections.size() == 3);
    assert(sections[0].topic == "Topic A");
    assert(sections[0].label() == "Topic A");
    // B must not pick up C's drawer
    assert(sections[1].topic.empty());
    assert(sections[1].label() == "Heading B");
    assert(sections[2].label() == "Topic C");
}

void TestPositionsAreCharacters() {
    // "é" and "ü" are two bytes each
    const std::string doc = "* \xC3\xA9t\xC3\xA9\n\xC3\xBC\n* b\n";
    std::vector<Section> sections = find_top_level_sections(doc);
    assert(sections.size() == 2);
    assert(sections[0].title == "\xC3\xA9t\xC3\xA9");
    assert(sections[1].start_pos == 8);
    assert(sections[1].end_pos == 12);
}

void TestFilterRequiresFullContainment() {
    std::vector<Bounds> bounds;
    bounds.push_back(Bounds(10, 20));   // at the start edge
    bounds.push_back(Bounds(40, 50));   // ends exactly at the section end
    bounds.push_back(Bounds(45, 60));   // straddles the boundary
    bounds.push_back(Bounds(60, 70));   // next section

    std::vector<Bounds> first = filter_bounds_for_section(bounds, 10, 50);
    assert(first.size() == 2);
    assert(first[0] == Bounds(10, 20));
    assert(first[1] == Bounds(40, 50));

    std::vector<Bounds> second = filter_bounds_for_section(bounds, 50, 80);
    assert(second.size() == 1);
    assert(second[0] == Bounds(60, 70));
}

void TestStraddlingMarkerIsDropped() {
    // A marker crossing a heading belongs to neither section, so its text is
    // lost. Current behaviour; a fix would split it instead.
    std::vector<Bounds> bounds;
    bounds.push_back(Bounds(30, 70));
    assert(filter_bounds_for_section(bounds, 0, 50).empty());
    assert(filter_bounds_for_section(bounds, 50, 100).empty());
}

void TestRebase() {
    std::vector<Bounds> bounds;
    bounds.push_back(Bounds(60, 70));
    bounds.push_back(Bounds(75, 90));
    std::vector<Bounds> rebased = rebase_bounds(bounds, 50);
    assert(rebased.size() == 2);
    assert(rebased[0] == Bounds(10, 20));
    assert(rebased[1] == Bounds(25, 40));
}

int main() {
    TestFindSections();
    TestNoSections();
    TestTopicFromDrawer();
    TestPositionsAreCharacters();
    TestFilterRequiresFullContainment();
    TestStraddlingMarkerIsDropped();
    TestRebase();
    return 0;
}

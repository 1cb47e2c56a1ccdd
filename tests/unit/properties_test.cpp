/*
 * dailies C++17 - Property drawer tests
 */
#include <dailies/org/properties.hpp>

#include <cassert>
#include <string>
#include <vector>

using namespace dailies;

void TestFindBlock() {
    const std::string text =
        "#+TITLE: notes\n"
        ":PROPERTIES:\n"
        ":GPTEL_MODEL: claude-3-opus\n"
        ":GPTEL_BACKEND: Claude\n"
        "not an entry\n"
        ":GPTEL_BOUNDS: ((response (120 480)))\n"
        ":END:\n"
        "body\n";

    PropertyBlock block = find_property_block(text);
    assert(block.found);
    assert(block.begin == text.find(":PROPERTIES:"));
    assert(text.compare(block.end - 5, 5, ":END:") == 0);
    assert(block.entries.size() == 3);
    assert(block.entries[0].first == "GPTEL_MODEL");
    assert(block.get("GPTEL_BACKEND") == "Claude");
    assert(block.has("GPTEL_BOUNDS"));
    assert(!block.has("GPTEL_SYSTEM"));
    assert(block.get("GPTEL_SYSTEM", "none") == "none");
}

void TestLastEntryWins() {
    PropertyBlock block = find_property_block(":PROPERTIES:\n:A: 1\n:A: 2\n:END:\n");
    assert(block.found);
    assert(block.get("A") == "2");
}

void TestOpeningTagNeedsLineBreak() {
    assert(!find_property_block(":PROPERTIES: :A: 1 :END:").found);

    // Blank lines between the tag and the first entry are fine
    PropertyBlock block = find_property_block(":PROPERTIES:  \n\n:A: 1\n:END:");
    assert(block.found);
    assert(block.get("A") == "1");

    // A same-line tag is skipped in favour of the next real drawer
    block = find_property_block("see :PROPERTIES: here\n:PROPERTIES:\n:B: 2\n:END:\n");
    assert(block.found);
    assert(block.get("B") == "2");
}

void TestUnclosedDrawer() {
    assert(!find_property_block(":PROPERTIES:\n:A: 1\n").found);
    assert(!find_property_block("").found);
}

void TestSearchFromOffset() {
    const std::string text = ":PROPERTIES:\n:A: 1\n:END:\n* H\n:PROPERTIES:\n:A: 2\n:END:\n";
    PropertyBlock first = find_property_block(text);
    PropertyBlock second = find_property_block(text, first.end);
    assert(first.get("A") == "1");
    assert(second.found);
    assert(second.get("A") == "2");
    assert(!find_property_block(text, second.end).found);
}

void TestReadGptelProperties() {
    const std::string text =
        ":PROPERTIES:\n"
        ":GPTEL_MODEL: gpt-4o\n"
        ":GPTEL_BACKEND: ChatGPT\n"
        ":GPTEL_SYSTEM: You are a helpful assistant.\n"
        ":GPTEL_TOPIC: weekend plans\n"
        ":GPTEL_BOUNDS: ((response (10 20) (30 40)))\n"
        ":END:\n";

    GptelProperties p = read_gptel_properties(find_property_block(text));
    assert(p.model == "gpt-4o");
    assert(p.backend == "ChatGPT");
    assert(p.system == "You are a helpful assistant.");
    assert(p.topic == "weekend plans");
    assert(p.bounds_raw == "((response (10 20) (30 40)))");
    assert(p.bounds.size() == 2);
    assert(p.bounds[1] == Bounds(30, 40));

    GptelProperties none = read_gptel_properties(PropertyBlock());
    assert(none.model.empty());
    assert(none.bounds.empty());
}

void TestRender() {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.push_back(std::make_pair(std::string(props::TOPIC), std::string("Greeting")));
    entries.push_back(std::make_pair(std::string(props::MODEL), std::string("m")));
    std::string out = render_property_block(entries);
    assert(out == ":PROPERTIES:\n:GPTEL_TOPIC: Greeting\n:GPTEL_MODEL: m\n:END:\n");

    PropertyBlock back = find_property_block(out);
    assert(back.entries == entries);
}

int main() {
    TestFindBlock();
    TestLastEntryWins();
    TestOpeningTagNeedsLineBreak();
    TestUnclosedDrawer();
    TestSearchFromOffset();
    TestReadGptelProperties();
    TestRender();
    return 0;
}

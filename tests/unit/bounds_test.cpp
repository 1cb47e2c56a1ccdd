/*
 * dailies C++17 - GPTEL_BOUNDS codec tests
 */
#include <dailies/org/bounds.hpp>

#include <cassert>
#include <string>
#include <vector>

using namespace dailies;

void TestDottedPairs() {
    std::vector<Bounds> b = decode_bounds("((10 . 20))");
    assert(b.size() == 1);
    assert(b[0] == Bounds(10, 20));

    // whitespace around the dot is optional
    b = decode_bounds("((1 .2) (3. 4) (5.6))");
    assert(b.size() == 3);
    assert(b[0] == Bounds(1, 2));
    assert(b[1] == Bounds(3, 4));
    assert(b[2] == Bounds(5, 6));
}

void TestTaggedPairs() {
    std::vector<Bounds> b = decode_bounds("((response (10 20) (30 40)))");
    assert(b.size() == 2);
    assert(b[0] == Bounds(10, 20));
    assert(b[1] == Bounds(30, 40));

    b = decode_bounds("((response\n  (1116   2260)\n  (2648 3860)))");
    assert(b.size() == 2);
    assert(b[1] == Bounds(2648, 3860));
}

void TestOrderIsPreserved() {
    std::vector<Bounds> b = decode_bounds("((response (30 40) (10 20)))");
    assert(b.size() == 2);
    assert(b[0] == Bounds(30, 40));
    assert(b[1] == Bounds(10, 20));
}

void TestMalformedYieldsWhatMatches() {
    assert(decode_bounds("").empty());
    assert(decode_bounds("nil").empty());
    assert(decode_bounds("((response))").empty());

    std::vector<Bounds> b = decode_bounds("((response (10 x) (5 6) (7)))");
    assert(b.size() == 1);
    assert(b[0] == Bounds(5, 6));

    // The tag selects the grammar: dotted pairs are not read once it is present
    assert(decode_bounds("((response (10 . 20)))").empty());

    // Negative numbers never match
    assert(decode_bounds("((-3 . 4))").empty());
}

void TestOverflowingPairIsSkipped() {
    std::vector<Bounds> b = decode_bounds("((response (99999999999999999999 5) (1 2)))");
    assert(b.size() == 1);
    assert(b[0] == Bounds(1, 2));
}

void TestEncode() {
    assert(encode_bounds(std::vector<Bounds>()) == "((response))");

    std::vector<Bounds> b;
    b.push_back(Bounds(1, 2));
    b.push_back(Bounds(300, 4000));
    assert(encode_bounds(b) == "((response (1 2) (300 4000)))");
}

void TestEncodeDecode() {
    std::vector<Bounds> b;
    b.push_back(Bounds(49, 124));
    b.push_back(Bounds(130, 1200));
    b.push_back(Bounds(1250, 1251));
    assert(decode_bounds(encode_bounds(b)) == b);
}

void TestDecodeIsIdempotent() {
    const std::string raw = "((response (1116 2260) (2648 3860)))";
    std::vector<Bounds> first = decode_bounds(raw);
    std::vector<Bounds> second = decode_bounds(raw);
    assert(first == second);
    assert(encode_bounds(first) == raw);

    const std::string legacy = "((1807 . 3547) (4000 . 4100))";
    assert(decode_bounds(legacy) == decode_bounds(legacy));
    assert(decode_bounds(encode_bounds(decode_bounds(legacy))) == decode_bounds(legacy));
}

void TestSortIsStable() {
    std::vector<Bounds> b;
    b.push_back(Bounds(30, 40));
    b.push_back(Bounds(10, 15));
    b.push_back(Bounds(10, 12));
    sort_bounds(b);
    assert(b[0] == Bounds(10, 15));
    assert(b[1] == Bounds(10, 12));
    assert(b[2] == Bounds(30, 40));
}

int main() {
    TestDottedPairs();
    TestTaggedPairs();
    TestOrderIsPreserved();
    TestMalformedYieldsWhatMatches();
    TestOverflowingPairIsSkipped();
    TestEncode();
    TestEncodeDecode();
    TestDecodeIsIdempotent();
    TestSortIsStable();
    return 0;
}

/*
 * dailies C++17 - GPTEL_BOUNDS codec
 *
 * gptel marks assistant responses with character ranges stored in the
 * GPTEL_BOUNDS property. Two encodings exist in the wild:
 *
 *   ((1807 . 3547) (4000 . 4100))          older gptel, dotted pairs
 *   ((response (1116 2260) (2648 3860)))   current gptel, tagged list
 *
 * Both are read; only the tagged form is written. The tagged grammar is what
 * gptel itself reads back, so encode_bounds() output must not change shape.
 */
#ifndef dailies_ORG_BOUNDS_HPP
#define dailies_ORG_BOUNDS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace dailies {

struct Bounds {
    int64_t start;
    int64_t end;

    Bounds() : start(0), end(0) {}
    Bounds(int64_t s, int64_t e) : start(s), end(e) {}

    bool operator==(const Bounds& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Bounds& o) const { return !(*this == o); }
};

// Never fails: whatever the active pattern matches is returned, in order.
std::vector<Bounds> decode_bounds(const std::string& raw);

// ((response (s1 e1) (s2 e2) ...)); an empty list gives "((response))"
std::string encode_bounds(const std::vector<Bounds>& bounds);

// Stable sort by start
void sort_bounds(std::vector<Bounds>& bounds);

} // namespace dailies

#endif // dailies_ORG_BOUNDS_HPP

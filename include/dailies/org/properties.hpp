/*
 * dailies C++17 - Org property drawers
 *
 *   :PROPERTIES:
 *   :GPTEL_MODEL: claude-3-opus
 *   :GPTEL_BOUNDS: ((response (120 480)))
 *   :END:
 */
#ifndef dailies_ORG_PROPERTIES_HPP
#define dailies_ORG_PROPERTIES_HPP

#include <dailies/org/bounds.hpp>
#include <string>
#include <vector>
#include <utility>

namespace dailies {

struct PropertyBlock {
    bool found;
    size_t begin;   // byte offset of ":PROPERTIES:"
    size_t end;     // byte offset just past ":END:"
    std::vector<std::pair<std::string, std::string>> entries;   // in file order

    PropertyBlock() : found(false), begin(0), end(0) {}

    // Value of the last entry named `name`, or default_val
    std::string get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;
};

// First drawer at or after byte `from`. The opening tag must be followed by a
// line break; the body runs to the next ":END:".
PropertyBlock find_property_block(const std::string& text, size_t from = 0);

// gptel's per-file / per-heading properties
struct GptelProperties {
    std::string model;
    std::string backend;
    std::string system;
    std::string topic;
    std::string bounds_raw;
    std::vector<Bounds> bounds;
};

GptelProperties read_gptel_properties(const PropertyBlock& block);

// Property names used by gptel
namespace props {
extern const char* const MODEL;
extern const char* const BACKEND;
extern const char* const SYSTEM;
extern const char* const BOUNDS;
extern const char* const TOPIC;
}

// ":PROPERTIES:\n:NAME: value\n...:END:\n"
std::string render_property_block(const std::vector<std::pair<std::string, std::string>>& entries);

} // namespace dailies

#endif // dailies_ORG_PROPERTIES_HPP

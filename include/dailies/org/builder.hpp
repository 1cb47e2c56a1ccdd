/*
 * dailies C++17 - gptel org document builder
 *
 * Writes conversations as an org file that gptel recognises: assistant
 * replies are listed in a file-level GPTEL_BOUNDS drawer.
 *
 * The drawer sits in front of the body, so every position it stores is
 * shifted by the drawer's own length, which in turn depends on how many
 * digits those positions have. build_org_document() iterates until the
 * encoded value stops changing.
 */
#ifndef dailies_ORG_BUILDER_HPP
#define dailies_ORG_BUILDER_HPP

#include <dailies/chat/conversation.hpp>
#include <dailies/org/bounds.hpp>
#include <dailies/core/config.hpp>
#include <string>
#include <vector>

namespace dailies {

struct BuildOptions {
    int max_iterations;         // fixed-point passes before giving up (default: 10)
    int heading_offset;         // markdown "#" maps to 1 + heading_offset stars (default: 3)
    size_t max_heading_chars;   // user message headings are cut to this width (default: 60)

    BuildOptions() : max_iterations(10), heading_offset(3), max_heading_chars(60) {}

    // builder.max_iterations, builder.heading_offset, builder.max_heading_chars
    static BuildOptions from_config(const Config& cfg);
};

struct BuildResult {
    std::string document;
    std::string bounds;             // encoded GPTEL_BOUNDS value, empty without replies
    std::vector<Bounds> positions;  // decoded form of `bounds` (1-based, absolute)
    int iterations;                 // fixed-point passes used
    bool converged;

    BuildResult() : iterations(0), converged(true) {}
};

// Phase 1: the body without the bounds drawer. `response_spans` receives the
// zero-based character range of every rendered assistant reply.
std::string build_org_body(const std::vector<Conversation>& conversations,
                           const BuildOptions& options,
                           std::vector<Bounds>& response_spans);

// ":PROPERTIES:\n:GPTEL_BOUNDS: <bounds>\n:END:\n\n"
std::string render_bounds_header(const std::string& bounds);

// Phase 2 on top of phase 1. Without assistant replies the body is returned
// as is. If the bounds do not settle within max_iterations the last value is
// used, a warning is logged and `converged` is false.
BuildResult build_org_document(const std::vector<Conversation>& conversations,
                               const BuildOptions& options = BuildOptions());

} // namespace dailies

#endif // dailies_ORG_BUILDER_HPP

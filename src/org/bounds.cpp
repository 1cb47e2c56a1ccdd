#include <dailies/org/bounds.hpp>
#include <dailies/core/utils.hpp>
#include <dailies/core/logger.hpp>
#include <algorithm>
#include <regex>
#include <sstream>

namespace dailies {

namespace {

const char* const kResponseTag = "response";

std::vector<Bounds> match_pairs(const std::string& raw, const std::regex& pattern) {
    std::vector<Bounds> out;
    std::sregex_iterator iter(raw.begin(), raw.end(), pattern);
    std::sregex_iterator end;
    for (; iter != end; ++iter) {
        const std::smatch& m = *iter;
        int64_t start = 0;
        int64_t stop = 0;
        if (!parse_int64(m[1].str(), start) || !parse_int64(m[2].str(), stop)) {
            LOG_DEBUG("[Bounds] Skipping out-of-range pair '%s'", m[0].str().c_str());
            continue;
        }
        out.push_back(Bounds(start, stop));
    }
    return out;
}

} // anonymous namespace

std::vector<Bounds> decode_bounds(const std::string& raw) {
    if (raw.empty()) {
        return std::vector<Bounds>();
    }

    if (raw.find(kResponseTag) != std::string::npos) {
        static const std::regex tagged("\\((\\d+)\\s+(\\d+)\\)");
        return match_pairs(raw, tagged);
    }

    static const std::regex dotted("\\((\\d+)\\s*\\.\\s*(\\d+)\\)");
    return match_pairs(raw, dotted);
}

std::string encode_bounds(const std::vector<Bounds>& bounds) {
    std::ostringstream oss;
    oss << "((" << kResponseTag;
    for (size_t i = 0; i < bounds.size(); ++i) {
        oss << " (" << bounds[i].start << " " << bounds[i].end << ")";
    }
    oss << "))";
    return oss.str();
}

void sort_bounds(std::vector<Bounds>& bounds) {
    std::stable_sort(bounds.begin(), bounds.end(),
                     [](const Bounds& a, const Bounds& b) { return a.start < b.start; });
}

} // namespace dailies

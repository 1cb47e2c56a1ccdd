/*
 * dailies C++17 - gptel org document parser
 *
 *   file drawer (GPTEL_BOUNDS) --> sections --> per-section markers --> messages
 */
#include <dailies/org/document_parser.hpp>
#include <dailies/org/extractor.hpp>
#include <dailies/org/properties.hpp>
#include <dailies/org/sections.hpp>
#include <dailies/org/text_index.hpp>
#include <dailies/core/logger.hpp>
#include <dailies/core/utils.hpp>

#include <regex>

namespace dailies {

ParseOptions ParseOptions::from_config(const Config& cfg) {
    ParseOptions o;
    o.extension = cfg.get_string("parser.extension", o.extension);
    o.one_based_bounds = cfg.get_bool("parser.one_based_bounds", o.one_based_bounds);
    return o;
}

namespace {

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m == 2 && is_leap_year(y)) return 29;
    return days[m - 1];
}

Conversation make_conversation(const std::string& source_path, const std::string& date,
                               const GptelProperties& file_props) {
    Conversation conv;
    conv.source_path = source_path;
    conv.date = date;
    conv.model = file_props.model;
    conv.system_prompt = file_props.system;
    return conv;
}

} // anonymous namespace

std::string parse_date_from_filename(const std::string& path) {
    static const std::regex pattern("^(\\d{4})-(\\d{2})-(\\d{2})\\.[A-Za-z0-9]+$");

    std::string name = base_name(path);
    std::smatch m;
    if (!std::regex_match(name, m, pattern)) {
        return "";
    }

    int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    if (year < 1 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        LOG_DEBUG("[Parser] '%s' looks like a date but is not one", name.c_str());
        return "";
    }
    return m[1].str() + "-" + m[2].str() + "-" + m[3].str();
}

std::vector<Bounds> normalize_bounds(const std::vector<Bounds>& raw, bool one_based) {
    const int64_t shift = one_based ? 1 : 0;
    std::vector<Bounds> out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        Bounds b(raw[i].start - shift, raw[i].end - shift);
        if (b.start < 0 || b.start >= b.end) {
            LOG_DEBUG("[Parser] Skipping marker (%lld %lld)",
                      static_cast<long long>(raw[i].start), static_cast<long long>(raw[i].end));
            continue;
        }
        out.push_back(b);
    }
    return out;
}

std::vector<Conversation> parse_org_document(const std::string& content,
                                             const std::string& source_path,
                                             const ParseOptions& options) {
    std::vector<Conversation> conversations;

    GptelProperties file_props = read_gptel_properties(find_property_block(content));
    std::vector<Bounds> bounds = normalize_bounds(file_props.bounds, options.one_based_bounds);
    if (bounds.empty()) {
        LOG_DEBUG("[Parser] No gptel markers in %s", source_path.c_str());
        return conversations;
    }

    const std::string date = parse_date_from_filename(source_path);
    std::vector<Section> sections = find_top_level_sections(content);

    if (sections.empty()) {
        Conversation conv = make_conversation(source_path, date, file_props);
        conv.topic = file_props.topic;
        conv.messages = extract_messages(content, bounds);
        if (!conv.messages.empty()) {
            conversations.push_back(conv);
        }
        return conversations;
    }

    TextIndex index(content);
    size_t assigned = 0;
    for (size_t i = 0; i < sections.size(); ++i) {
        const Section& section = sections[i];
        std::vector<Bounds> section_bounds =
            filter_bounds_for_section(bounds, section.start_pos, section.end_pos);
        if (section_bounds.empty()) {
            continue;
        }
        assigned += section_bounds.size();

        Conversation conv = make_conversation(source_path, date, file_props);
        conv.topic = section.label();
        conv.messages = extract_messages(index.slice(section.start_pos, section.end_pos),
                                         rebase_bounds(section_bounds, section.start_pos));
        if (!conv.messages.empty()) {
            conversations.push_back(conv);
        }
    }

    if (assigned < bounds.size()) {
        LOG_WARN("[Parser] %s: %zu marker(s) not contained in a single section were ignored",
                 source_path.c_str(), bounds.size() - assigned);
    }

    return conversations;
}

ParseResult parse_org_file(const std::string& path, const ParseOptions& options) {
    std::string content;
    std::string error;
    if (!read_file(path, content, error)) {
        return ParseResult::fail(error);
    }
    if (!is_valid_utf8(content)) {
        return ParseResult::fail("'" + path + "' is not valid UTF-8");
    }
    return ParseResult::ok(parse_org_document(content, path, options));
}

DirectoryParseReport parse_directory(const std::string& dir, const ParseOptions& options) {
    DirectoryParseReport report;

    std::vector<std::string> files;
    if (!list_files(dir, options.extension, files, report.error)) {
        LOG_ERROR("[Parser] %s", report.error.c_str());
        return report;
    }
    report.success = true;

    for (size_t i = 0; i < files.size(); ++i) {
        ++report.files_seen;
        ParseResult result = parse_org_file(files[i], options);
        if (!result.success) {
            LOG_ERROR("[Parser] Error parsing %s: %s", files[i].c_str(), result.error.c_str());
            ParseFailure failure;
            failure.path = files[i];
            failure.error = result.error;
            report.failures.push_back(failure);
            continue;
        }
        if (!result.conversations.empty()) {
            ++report.files_with_conversations;
            report.conversations.insert(report.conversations.end(),
                                        result.conversations.begin(), result.conversations.end());
        }
    }

    LOG_INFO("[Parser] %s: %zu files, %zu conversations, %zu failures",
             dir.c_str(), report.files_seen, report.conversations.size(), report.failures.size());
    return report;
}

} // namespace dailies

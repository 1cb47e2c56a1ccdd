/*
 * dailies C++17 - gptel org document parser
 *
 * Entry points for turning org files (typically org-roam dailies named
 * YYYY-MM-DD.org) into conversations. The file-level drawer carries every
 * GPTEL_BOUNDS marker of the file; top-level headings split the file into
 * independent conversations.
 */
#ifndef dailies_ORG_DOCUMENT_PARSER_HPP
#define dailies_ORG_DOCUMENT_PARSER_HPP

#include <dailies/chat/conversation.hpp>
#include <dailies/org/bounds.hpp>
#include <dailies/core/config.hpp>
#include <string>
#include <vector>

namespace dailies {

struct ParseOptions {
    std::string extension;      // files picked up by parse_directory()
    bool one_based_bounds;      // GPTEL_BOUNDS holds editor (1-based) positions

    ParseOptions() : extension(".org"), one_based_bounds(true) {}

    // parser.extension, parser.one_based_bounds
    static ParseOptions from_config(const Config& cfg);
};

struct ParseResult {
    bool success;
    std::string error;
    std::vector<Conversation> conversations;

    ParseResult() : success(false) {}

    static ParseResult ok(const std::vector<Conversation>& convs) {
        ParseResult r;
        r.success = true;
        r.conversations = convs;
        return r;
    }

    static ParseResult fail(const std::string& err) {
        ParseResult r;
        r.error = err;
        return r;
    }
};

struct ParseFailure {
    std::string path;
    std::string error;
};

struct DirectoryParseReport {
    bool success;                       // false only if the directory itself is unusable
    std::string error;
    size_t files_seen;
    size_t files_with_conversations;
    std::vector<Conversation> conversations;
    std::vector<ParseFailure> failures;

    DirectoryParseReport() : success(false), files_seen(0), files_with_conversations(0) {}
};

// "2024-03-15.org" -> "2024-03-15"; empty when the name is not a calendar date
std::string parse_date_from_filename(const std::string& path);

// GPTEL_BOUNDS values as zero-based offsets: one-based input is shifted down
// and markers that end up empty or negative are skipped.
std::vector<Bounds> normalize_bounds(const std::vector<Bounds>& raw, bool one_based);

// Parse an in-memory document. `source_path` is recorded on every
// conversation and used for the date.
std::vector<Conversation> parse_org_document(const std::string& content,
                                             const std::string& source_path,
                                             const ParseOptions& options = ParseOptions());

// Read and parse one file. Unreadable or non-UTF-8 files fail.
ParseResult parse_org_file(const std::string& path, const ParseOptions& options = ParseOptions());

// Every matching file in `dir`, in name order. A failing file is logged and
// recorded in the report; the remaining files are still parsed.
DirectoryParseReport parse_directory(const std::string& dir,
                                     const ParseOptions& options = ParseOptions());

} // namespace dailies

#endif // dailies_ORG_DOCUMENT_PARSER_HPP

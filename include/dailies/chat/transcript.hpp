/*
 * dailies C++17 - Chat history import
 *
 * Mobile chat exports arrive as a CSV with "Date" and "Conversation" columns.
 * Each conversation is a plain transcript:
 *
 *   Question:
 *   How do I ...
 *   AI Response:
 *   You can ...
 *
 * Conversations are grouped per calendar day so that each day can be written
 * as one org daily file.
 */
#ifndef dailies_CHAT_TRANSCRIPT_HPP
#define dailies_CHAT_TRANSCRIPT_HPP

#include <dailies/chat/conversation.hpp>
#include <string>
#include <vector>

namespace dailies {

// Messages in order; empty ones are dropped. Text before the first label is
// ignored. "* " at a line start is rewritten to "- ".
std::vector<Message> parse_transcript(const std::string& text);

// First line of the first user message, cut to `max_chars` display
// characters; "Conversation" when there is no user message.
std::string make_topic(const std::vector<Message>& messages, size_t max_chars = 60);

// RFC 4180 records. Quoted fields may span lines; a leading UTF-8 BOM is
// skipped. Fails only on an unterminated quoted field.
bool parse_csv(const std::string& text, std::vector<std::vector<std::string>>& rows,
               std::string& error);

// "1/8/25, 10:16 PM" -> date "2025-01-08", minute of day 1336
bool parse_history_timestamp(const std::string& raw, std::string& date, int& minute_of_day);

struct HistoryDay {
    std::string date;                       // YYYY-MM-DD
    std::vector<Conversation> conversations; // ordered by time of day
};

struct HistoryImport {
    bool success;
    std::string error;
    size_t rows;
    size_t skipped_rows;
    std::vector<HistoryDay> days;           // ordered by date

    HistoryImport() : success(false), rows(0), skipped_rows(0) {}

    size_t conversation_count() const;
};

// Rows with a bad date are skipped with a warning; rows whose transcript
// yields no messages are ignored.
HistoryImport import_history_csv(const std::string& csv_text);

} // namespace dailies

#endif // dailies_CHAT_TRANSCRIPT_HPP

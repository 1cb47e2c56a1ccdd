/*
 * dailies C++17 - Chat History Import Implementation
 */
#include <dailies/chat/transcript.hpp>
#include <dailies/org/markup.hpp>
#include <dailies/core/logger.hpp>
#include <dailies/core/utils.hpp>

#include <algorithm>
#include <map>
#include <ctime>
#include <cstring>

namespace dailies {

namespace {

const char* const kQuestionLabel = "Question:";
const char* const kAnswerLabel = "AI Response:";

std::string rtrim_blanks(const std::string& s) {
    size_t end = s.find_last_not_of(" \t");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

void flush_message(bool open, MessageRole role, const std::vector<std::string>& lines,
                   std::vector<Message>& out) {
    if (!open) return;
    std::string content = trim(join(lines, "\n"));
    if (content.empty()) return;
    out.push_back(Message(role, escape_org_headlines(content)));
}

int column_index(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) return static_cast<int>(i);
    }
    return -1;
}

struct TimedConversation {
    int minute_of_day;
    Conversation conversation;
};

} // anonymous namespace

std::vector<Message> parse_transcript(const std::string& text) {
    std::string normalized = replace_all(replace_all(text, "\r\n", "\n"), "\r", "\n");
    std::vector<std::string> lines = split(normalized, '\n');

    std::vector<Message> messages;
    std::vector<std::string> current;
    MessageRole role = MessageRole::USER;
    bool open = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string label = rtrim_blanks(lines[i]);
        if (label == kQuestionLabel || label == kAnswerLabel) {
            flush_message(open, role, current, messages);
            current.clear();
            role = (label == kQuestionLabel) ? MessageRole::USER : MessageRole::ASSISTANT;
            open = true;
            continue;
        }
        if (open) {
            current.push_back(lines[i]);
        }
    }
    flush_message(open, role, current, messages);

    return messages;
}

std::string make_topic(const std::vector<Message>& messages, size_t max_chars) {
    for (size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].role != MessageRole::USER) continue;
        const std::string& content = messages[i].content;
        size_t nl = content.find('\n');
        std::string line = trim(nl == std::string::npos ? content : content.substr(0, nl));
        return truncate_display(line, max_chars);
    }
    return "Conversation";
}

bool parse_csv(const std::string& text, std::vector<std::vector<std::string>>& rows,
               std::string& error) {
    rows.clear();
    size_t i = starts_with(text, "\xEF\xBB\xBF") ? 3 : 0;

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_data = false;
    bool field_started = false;

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"' && !field_started) {
            // Only a quote opening the field starts quoted mode
            in_quotes = true;
            field_started = true;
            row_has_data = true;
        } else if (c == ',') {
            row.push_back(field);
            field.clear();
            field_started = false;
            row_has_data = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            if (row_has_data || !field.empty()) {
                row.push_back(field);
                rows.push_back(row);
            }
            row.clear();
            field.clear();
            field_started = false;
            row_has_data = false;
        } else {
            field += c;
            field_started = true;
            row_has_data = true;
        }
    }

    if (in_quotes) {
        error = "unterminated quoted field in row " + std::to_string(rows.size() + 1);
        return false;
    }
    if (row_has_data || !field.empty()) {
        row.push_back(field);
        rows.push_back(row);
    }
    return true;
}

bool parse_history_timestamp(const std::string& raw, std::string& date, int& minute_of_day) {
    std::string s = trim(raw);
    struct tm tm_buf;
    std::memset(&tm_buf, 0, sizeof(tm_buf));

    const char* rest = strptime(s.c_str(), "%m/%d/%y, %I:%M %p", &tm_buf);
    if (rest == nullptr || *rest != '\0') {
        return false;
    }

    char buf[16];
    if (strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf) == 0) {
        return false;
    }
    date = buf;
    minute_of_day = tm_buf.tm_hour * 60 + tm_buf.tm_min;
    return true;
}

size_t HistoryImport::conversation_count() const {
    size_t n = 0;
    for (size_t i = 0; i < days.size(); ++i) {
        n += days[i].conversations.size();
    }
    return n;
}

HistoryImport import_history_csv(const std::string& csv_text) {
    HistoryImport result;

    std::vector<std::vector<std::string>> rows;
    if (!parse_csv(csv_text, rows, result.error)) {
        return result;
    }
    if (rows.empty()) {
        result.error = "empty CSV";
        return result;
    }

    const int date_col = column_index(rows[0], "Date");
    const int conv_col = column_index(rows[0], "Conversation");
    if (date_col < 0 || conv_col < 0) {
        result.error = "CSV header must contain 'Date' and 'Conversation' columns";
        return result;
    }

    std::map<std::string, std::vector<TimedConversation>> by_date;
    for (size_t r = 1; r < rows.size(); ++r) {
        const std::vector<std::string>& row = rows[r];
        ++result.rows;

        std::string date;
        int minute = 0;
        if (static_cast<size_t>(std::max(date_col, conv_col)) >= row.size() ||
            !parse_history_timestamp(row[static_cast<size_t>(date_col)], date, minute)) {
            LOG_WARN("[Import] Skipping row %zu with bad date", r + 1);
            ++result.skipped_rows;
            continue;
        }

        std::vector<Message> messages = parse_transcript(row[static_cast<size_t>(conv_col)]);
        if (messages.empty()) {
            continue;
        }

        TimedConversation tc;
        tc.minute_of_day = minute;
        tc.conversation.date = date;
        tc.conversation.topic = make_topic(messages);
        tc.conversation.messages = messages;
        by_date[date].push_back(tc);
    }

    for (std::map<std::string, std::vector<TimedConversation>>::iterator it = by_date.begin();
         it != by_date.end(); ++it) {
        std::vector<TimedConversation>& list = it->second;
        std::stable_sort(list.begin(), list.end(),
                         [](const TimedConversation& a, const TimedConversation& b) {
                             return a.minute_of_day < b.minute_of_day;
                         });
        HistoryDay day;
        day.date = it->first;
        for (size_t i = 0; i < list.size(); ++i) {
            day.conversations.push_back(list[i].conversation);
        }
        result.days.push_back(day);
    }

    result.success = true;
    LOG_INFO("[Import] %zu rows -> %zu conversations over %zu days (%zu skipped)",
             result.rows, result.conversation_count(), result.days.size(), result.skipped_rows);
    return result;
}

} // namespace dailies

#include <dailies/org/extractor.hpp>
#include <dailies/org/markup.hpp>
#include <dailies/org/text_index.hpp>
#include <dailies/core/logger.hpp>

namespace dailies {

namespace {

void emit_span(const TextIndex& index, MessageRole role, int64_t start, int64_t end,
               std::vector<Message>& out) {
    std::string text = strip_org_markup(index.slice(start, end));
    if (text.empty()) {
        return;
    }
    out.push_back(Message(role, text, start, end));
}

} // anonymous namespace

std::vector<Message> extract_messages(const std::string& sub_document,
                                      std::vector<Bounds> markers) {
    std::vector<Message> messages;
    if (markers.empty()) {
        return messages;
    }

    sort_bounds(markers);
    TextIndex index(sub_document);
    const int64_t length = index.size();

    int64_t cursor = 0;
    for (size_t i = 0; i < markers.size(); ++i) {
        const Bounds& b = markers[i];
        if (b.start > cursor) {
            emit_span(index, MessageRole::USER, cursor, b.start, messages);
        }
        emit_span(index, MessageRole::ASSISTANT, b.start, b.end, messages);
        cursor = b.end;
    }

    if (cursor < length) {
        emit_span(index, MessageRole::USER, cursor, length, messages);
    }

    LOG_DEBUG("[Extractor] %zu markers -> %zu messages", markers.size(), messages.size());
    return messages;
}

} // namespace dailies

/*
 * dailies C++17 - Conversation model
 *
 * Role-tagged messages recovered from (or written into) annotated org files.
 */
#ifndef dailies_CHAT_CONVERSATION_HPP
#define dailies_CHAT_CONVERSATION_HPP

#include <dailies/core/config.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace dailies {

enum class MessageRole {
    USER,       // initiator: everything outside a response region
    ASSISTANT   // responder: a response region
};

std::string role_to_string(MessageRole role);

// Unknown names map to USER
MessageRole string_to_role(const std::string& str);

struct Message {
    MessageRole role;
    std::string content;    // markup-stripped text
    int64_t char_start;     // pre-strip span in the source sub-document
    int64_t char_end;
    int token_count;

    Message() : role(MessageRole::USER), char_start(0), char_end(0), token_count(0) {}
    Message(MessageRole r, const std::string& c, int64_t start = 0, int64_t end = 0)
        : role(r), content(c), char_start(start), char_end(end), token_count(0) {}
};

struct Conversation {
    std::string source_path;
    std::string date;           // YYYY-MM-DD, empty when unknown
    std::string topic;
    std::string model;
    std::string system_prompt;
    std::vector<Message> messages;

    size_t count(MessageRole role) const;
};

Json to_json(const Message& msg);
Json to_json(const Conversation& conv);
Json to_json(const std::vector<Conversation>& convs);

// Accepts the shape produced by to_json(); offsets and token_count are optional.
bool from_json(const Json& j, Conversation& out, std::string& error);

} // namespace dailies

#endif // dailies_CHAT_CONVERSATION_HPP

#include <dailies/chat/conversation.hpp>

namespace dailies {

std::string role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        default: return "user";
    }
}

MessageRole string_to_role(const std::string& str) {
    if (str == "assistant") return MessageRole::ASSISTANT;
    return MessageRole::USER;
}

size_t Conversation::count(MessageRole role) const {
    size_t n = 0;
    for (size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].role == role) ++n;
    }
    return n;
}

Json to_json(const Message& msg) {
    Json j;
    j["role"] = role_to_string(msg.role);
    j["content"] = msg.content;
    j["char_start"] = msg.char_start;
    j["char_end"] = msg.char_end;
    j["token_count"] = msg.token_count;
    return j;
}

static Json optional_string(const std::string& s) {
    if (s.empty()) return Json();
    return Json(s);
}

Json to_json(const Conversation& conv) {
    Json j;
    j["source_path"] = conv.source_path;
    j["date"] = optional_string(conv.date);
    j["topic"] = optional_string(conv.topic);
    j["model"] = optional_string(conv.model);
    j["system_prompt"] = optional_string(conv.system_prompt);

    Json messages = Json::array();
    for (size_t i = 0; i < conv.messages.size(); ++i) {
        messages.push_back(to_json(conv.messages[i]));
    }
    j["messages"] = messages;
    return j;
}

Json to_json(const std::vector<Conversation>& convs) {
    Json arr = Json::array();
    for (size_t i = 0; i < convs.size(); ++i) {
        arr.push_back(to_json(convs[i]));
    }
    return arr;
}

static std::string string_field(const Json& j, const char* name) {
    if (j.contains(name) && j[name].is_string()) {
        return j[name].get<std::string>();
    }
    return "";
}

bool from_json(const Json& j, Conversation& out, std::string& error) {
    if (!j.is_object()) {
        error = "conversation must be an object";
        return false;
    }
    if (!j.contains("messages") || !j["messages"].is_array()) {
        error = "conversation.messages must be an array";
        return false;
    }

    Conversation conv;
    conv.source_path = string_field(j, "source_path");
    conv.date = string_field(j, "date");
    conv.topic = string_field(j, "topic");
    conv.model = string_field(j, "model");
    conv.system_prompt = string_field(j, "system_prompt");

    const Json& messages = j["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        const Json& m = messages[i];
        if (!m.is_object() || !m.contains("content") || !m["content"].is_string()) {
            error = "messages[" + std::to_string(i) + "].content must be a string";
            return false;
        }
        Message msg(string_to_role(string_field(m, "role")), m["content"].get<std::string>());
        if (m.contains("char_start") && m["char_start"].is_number_integer()) {
            msg.char_start = m["char_start"].get<int64_t>();
        }
        if (m.contains("char_end") && m["char_end"].is_number_integer()) {
            msg.char_end = m["char_end"].get<int64_t>();
        }
        if (m.contains("token_count") && m["token_count"].is_number_integer()) {
            msg.token_count = m["token_count"].get<int>();
        }
        conv.messages.push_back(msg);
    }

    out = conv;
    return true;
}

} // namespace dailies

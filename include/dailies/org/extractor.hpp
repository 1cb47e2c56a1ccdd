/*
 * dailies C++17 - Message extraction
 *
 * Walks a buffer left to right. Text inside a response marker becomes an
 * assistant message, text between markers a user message:
 *
 *   [user ....][assistant ....][user ..][assistant ......][user ...]
 *   0          s1              e1       s2                e2        len
 */
#ifndef dailies_ORG_EXTRACTOR_HPP
#define dailies_ORG_EXTRACTOR_HPP

#include <dailies/chat/conversation.hpp>
#include <dailies/org/bounds.hpp>
#include <string>
#include <vector>

namespace dailies {

// `markers` are zero-based character offsets into `sub_document`; they are
// sorted here but must not overlap. Offsets past the end are clamped.
// Spans whose stripped text is empty produce no message.
std::vector<Message> extract_messages(const std::string& sub_document,
                                      std::vector<Bounds> markers);

} // namespace dailies

#endif // dailies_ORG_EXTRACTOR_HPP

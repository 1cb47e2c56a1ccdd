#include <dailies/org/text_index.hpp>
#include <algorithm>

namespace dailies {

TextIndex::TextIndex(const std::string& text) : text_(text), ascii_(true) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (static_cast<unsigned char>(text[i]) >= 0x80) {
            ascii_ = false;
            break;
        }
    }
    if (ascii_) return;

    char_starts_.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            char_starts_.push_back(i);
        }
    }
}

size_t TextIndex::byte_at(int64_t pos) const {
    if (pos <= 0) return 0;
    if (pos >= size()) return text_.size();
    if (ascii_) return static_cast<size_t>(pos);
    return char_starts_[static_cast<size_t>(pos)];
}

int64_t TextIndex::char_at(size_t byte) const {
    if (byte >= text_.size()) return size();
    if (ascii_) return static_cast<int64_t>(byte);
    std::vector<size_t>::const_iterator it =
        std::upper_bound(char_starts_.begin(), char_starts_.end(), byte);
    if (it == char_starts_.begin()) return 0;
    return static_cast<int64_t>(it - char_starts_.begin()) - 1;
}

std::string TextIndex::slice(int64_t start, int64_t end) const {
    size_t b = byte_at(start);
    size_t e = byte_at(end);
    if (b >= e) return "";
    return text_.substr(b, e - b);
}

} // namespace dailies

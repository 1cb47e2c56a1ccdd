/*
 * dailies C++17 - Text Index
 *
 * Character (code point) offsets are what gptel writes into GPTEL_BOUNDS;
 * std::string works in bytes. TextIndex maps between the two for one
 * immutable buffer.
 */
#ifndef dailies_ORG_TEXT_INDEX_HPP
#define dailies_ORG_TEXT_INDEX_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace dailies {

class TextIndex {
public:
    // The referenced text must outlive the index.
    explicit TextIndex(const std::string& text);

    // Number of characters in the buffer
    int64_t size() const {
        return static_cast<int64_t>(ascii_ ? text_.size() : char_starts_.size());
    }

    // Byte offset of character `pos`, clamped to [0, size()]
    size_t byte_at(int64_t pos) const;

    // Character containing byte `byte`; clamped to [0, size()]
    int64_t char_at(size_t byte) const;

    // Characters [start, end) as a byte string; empty when start >= end
    std::string slice(int64_t start, int64_t end) const;

private:
    const std::string& text_;
    // Start byte of every character; left empty for pure ASCII text,
    // where characters and bytes coincide.
    std::vector<size_t> char_starts_;
    bool ascii_;
};

} // namespace dailies

#endif // dailies_ORG_TEXT_INDEX_HPP

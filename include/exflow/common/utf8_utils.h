#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace exflow::common {

namespace detail {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0 if it is
// malformed. Overlong forms, surrogates and code points above U+10FFFF are rejected.
inline size_t utf8SequenceLength(const unsigned char* data, size_t n, size_t i) {
    auto cont = [&](size_t at) { return at < n && (data[at] & 0xC0) == 0x80; };

    unsigned char c = data[i];
    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF)
        return cont(i + 1) ? 2 : 0;
    if (i + 1 >= n)
        return 0;

    unsigned char c1 = data[i + 1];
    if (c >= 0xE0 && c <= 0xEF) {
        if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F))
            return 0;
        return cont(i + 1) && cont(i + 2) ? 3 : 0;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F))
            return 0;
        return cont(i + 1) && cont(i + 2) && cont(i + 3) ? 4 : 0;
    }
    return 0;
}

} // namespace detail

// Byte offset of the first byte that does not start a well-formed UTF-8 sequence.
inline std::optional<size_t> findInvalidUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    for (size_t i = 0; i < input.size();) {
        size_t len = detail::utf8SequenceLength(data, input.size(), i);
        if (len == 0)
            return i;
        i += len;
    }
    return std::nullopt;
}

inline bool isValidUtf8(std::string_view input) {
    return !findInvalidUtf8(input).has_value();
}

// Malformed bytes become '?' so paths and messages can be echoed in reports.
inline std::string sanitizeUtf8(std::string_view input) {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size();) {
        size_t len = detail::utf8SequenceLength(data, input.size(), i);
        if (len == 0) {
            out.push_back('?');
            ++i;
        } else {
            out.append(input.substr(i, len));
            i += len;
        }
    }
    return out;
}

} // namespace exflow::common

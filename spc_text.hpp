/**
 * spc payload - version 1.00
 * --------------------------------------------------------
 * Swiss Payment Code (QR-bill) payload generator and validator
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <string_view>
#include <cctype>
#include <utf8proc.h>

namespace spc {

// Line breaks in any form: CR, LF, VT, FF, NEL, LINE/PARAGRAPH SEPARATOR
inline bool is_line_break(utf8proc_int32_t cp) {
    switch (cp) {
    case 0x0A: // \n
    case 0x0B: // \v
    case 0x0C: // \f
    case 0x0D: // \r
    case 0x85:
    case 0x2028:
    case 0x2029:
        return true;
    default:
        return false;
    }
}

// Character set accepted in the payload:
// 0x20-0x7E printable ASCII, 0xA0-0xFF Latin-1 supplement
inline bool is_allowed_char(utf8proc_int32_t cp) {
    return (cp >= 0x20 && cp <= 0x7E) || (cp >= 0xA0 && cp <= 0xFF);
}

inline bool is_blank_char(utf8proc_int32_t cp) {
    return cp == 0x20 || cp == 0xA0;
}

// Reduce free text to the payload character set.
// - line breaks and out-of-range code points (emoji, other scripts,
//   control characters, invalid UTF-8 bytes) act as word boundaries
// - whitespace runs collapse to one ASCII space, ends are trimmed
// Result is UTF-8 and never contains CR or LF. sanitize(sanitize(x)) == sanitize(x).
inline std::string sanitize(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    const utf8proc_uint8_t* p   = reinterpret_cast<const utf8proc_uint8_t*>(in.data());
    const utf8proc_uint8_t* end = p + in.size();
    bool pending_space = false;

    while (p < end) {
        utf8proc_int32_t cp = 0;
        const utf8proc_ssize_t adv =
            utf8proc_iterate(p, (utf8proc_ssize_t)(end - p), &cp);
        if (adv <= 0) { // invalid byte
            ++p;
            pending_space = true;
            continue;
        }
        p += adv;

        if (is_line_break(cp) || is_blank_char(cp) || !is_allowed_char(cp)) {
            pending_space = true;
            continue;
        }

        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;

        utf8proc_uint8_t buf[4];
        const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
        if (w > 0) {
            out.append(reinterpret_cast<char*>(buf), (size_t)w);
        }
    }
    return out;
}

// Number of code points (length limits are in characters, not bytes)
inline std::size_t char_count(std::string_view s) {
    const utf8proc_uint8_t* p   = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
    const utf8proc_uint8_t* end = p + s.size();
    std::size_t n = 0;
    while (p < end) {
        utf8proc_int32_t cp = 0;
        const utf8proc_ssize_t adv =
            utf8proc_iterate(p, (utf8proc_ssize_t)(end - p), &cp);
        p += (adv > 0) ? adv : 1;
        ++n;
    }
    return n;
}

// ----------------------- minimal ASCII utilities (UTF-8 safe) ------------------
inline std::string strip_whitespace(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        if (c==' '||c=='\t'||c=='\n'||c=='\r'||c=='\f'||c=='\v') continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

inline std::string ascii_upper(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(c < 0x80 ? std::toupper(c) : c));
    }
    return out;
}

inline bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s) if (c < '0' || c > '9') return false;
    return true;
}

inline bool all_upper_alnum(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s)
        if (!((c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z'))) return false;
    return true;
}

} // namespace spc

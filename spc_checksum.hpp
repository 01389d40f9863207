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
#include <optional>

namespace spc {

// ---------- ISO 7064 MOD 97-10 ----------

// Remainder mod 97 of an alphanumeric string read as a decimal number,
// letters expanded to two digits (A=10 ... Z=35). Streaming, so the
// length of the input is unbounded. nullopt on any other character.
inline std::optional<int> mod97(std::string_view s) {
    int rem = 0;
    for (unsigned char c : s) {
        if (c >= '0' && c <= '9') {
            rem = (rem * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            rem = (rem * 100 + (c - 'A' + 10)) % 97;
        } else {
            return std::nullopt;
        }
    }
    return rem;
}

// Two check digits so that payload + digits is valid
inline std::optional<std::string> compute_check97(std::string_view payload) {
    std::string s(payload);
    s.append("00");
    auto rem = mod97(s);
    if (!rem) return std::nullopt;
    const int check = 98 - *rem;
    std::string out;
    out.push_back(static_cast<char>('0' + check / 10));
    out.push_back(static_cast<char>('0' + check % 10));
    return out;
}

inline bool is_valid97(std::string_view s) {
    auto rem = mod97(s);
    return rem && *rem == 1;
}

// IBAN and ISO 11649 layout: 2 letters + 2 check digits + body.
// The leading four characters move to the end before the check.
inline bool rotated_check_ok(std::string_view s) {
    if (s.size() < 5) return false;
    std::string rotated(s.substr(4));
    rotated.append(s.substr(0, 4));
    return is_valid97(rotated);
}

inline bool iban_checksum_ok(std::string_view iban) { return rotated_check_ok(iban); }
inline bool creditor_reference_ok(std::string_view ref) { return rotated_check_ok(ref); }

// Check digits for prefix ("CH", "RF") + body
inline std::optional<std::string> rotated_check_digits(std::string_view prefix, std::string_view body) {
    std::string s(body);
    s.append(prefix);
    return compute_check97(s);
}

// ---------- Modulo 10, recursive ----------

inline constexpr int kMod10Table[10] = {0, 9, 4, 6, 8, 2, 7, 1, 3, 5};

inline std::optional<int> compute_check10(std::string_view digits) {
    int carry = 0;
    for (unsigned char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
        carry = kMod10Table[(carry + (c - '0')) % 10];
    }
    return (10 - carry) % 10;
}

// Last digit is the check digit of the preceding ones
inline bool is_valid10(std::string_view s) {
    if (s.empty()) return false;
    const unsigned char last = static_cast<unsigned char>(s.back());
    if (last < '0' || last > '9') return false;
    auto check = compute_check10(s.substr(0, s.size() - 1));
    return check && *check == (last - '0');
}

} // namespace spc

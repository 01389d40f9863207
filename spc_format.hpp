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
#include "spc_model.hpp"
#include "spc_text.hpp"
#include "spc_checksum.hpp"
#include "spc_classify.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <iomanip>
#include <sstream>

namespace spc {

// ---------- Generators ----------

// QR reference from any seed (e.g. an invoice number): its digits, the
// rightmost 26 kept, left-padded with '0', plus the mod 10 check digit.
inline std::string generate_qr_reference(std::string_view seed) {
    std::string digits;
    for (unsigned char c : seed)
        if (c >= '0' && c <= '9') digits.push_back(static_cast<char>(c));

    const std::size_t body = kQrReferenceLength - 1;
    if (digits.size() > body) digits.erase(0, digits.size() - body);
    digits.insert(digits.begin(), body - digits.size(), '0');

    const int check = *compute_check10(digits); // digits only, always set
    digits.push_back(static_cast<char>('0' + check));
    return digits;
}

// ISO 11649 creditor reference "RF" + check digits + body.
// nullopt if the body is not 1..21 alphanumerics.
inline std::optional<std::string> generate_creditor_reference(std::string_view body) {
    const std::string b = ascii_upper(strip_whitespace(body));
    if (b.empty() || b.size() > kScorMaxLength - 4 || !all_upper_alnum(b))
        return std::nullopt;
    auto check = rotated_check_digits("RF", b);
    if (!check) return std::nullopt;
    return "RF" + *check + b;
}

// ---------- Display (never used for the payload) ----------

inline std::string group_chars(std::string_view s, std::size_t n, char sep) {
    if (n == 0) return std::string(s);
    std::string out;
    out.reserve(s.size() + s.size() / n);
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i > 0 && i % n == 0) out.push_back(sep);
        out.push_back(s[i]);
    }
    return out;
}

// CH9300762011623852957 -> "CH93 0076 2011 6238 5295 7"
inline std::string format_account(std::string_view account, const DisplayOptions& opt = {}) {
    return group_chars(ascii_upper(strip_whitespace(account)), opt.account_group, opt.group_separator);
}

// QR reference in blocks of 5, creditor reference in blocks of 4
inline std::string format_reference(std::string_view reference, const DisplayOptions& opt = {}) {
    const std::string r = normalize_reference(reference);
    if (is_qr_reference_shape(r))
        return group_chars(r, opt.qr_reference_group, opt.group_separator);
    return group_chars(r, opt.creditor_reference_group, opt.group_separator);
}

// CurrencyAmount -> "1'234.50"
inline std::string format_amount(const CurrencyAmount& a, const DisplayOptions& opt = {}) {
    const bool neg = a.minor < 0;
    // magnitude as unsigned, INT64_MIN has no signed negation
    const std::uint64_t v = neg ? 0 - static_cast<std::uint64_t>(a.minor)
                                : static_cast<std::uint64_t>(a.minor);
    const std::string major = std::to_string(v / 100);
    const std::uint64_t frac = v % 100;

    std::string grouped;
    grouped.reserve(major.size() + major.size() / 3);
    for (std::size_t i = 0; i < major.size(); ++i) {
        if (i > 0 && (major.size() - i) % 3 == 0) grouped.push_back(opt.thousands_separator);
        grouped.push_back(major[i]);
    }

    std::ostringstream oss;
    if (neg) oss << '-';
    oss << grouped << opt.decimal_separator
        << std::setw(2) << std::setfill('0') << frac;
    return oss.str();
}

// "Bahnhofstrasse 1", or just the street without a house number
inline std::string format_street_line(std::string_view street, std::string_view house_number) {
    const std::string s = sanitize(street);
    const std::string h = sanitize(house_number);
    if (s.empty()) return {};
    if (h.empty()) return s;
    return s + " " + h;
}

} // namespace spc

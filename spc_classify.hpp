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
#include <string>
#include <string_view>
#include <optional>

namespace spc {

// Institution identifier (IID), characters 5-9 of the account number.
// nullopt if the account is too short or the IID is not numeric.
inline std::optional<int> institution_id(std::string_view account) {
    if (account.size() < kIidOffset + kIidLength) return std::nullopt;
    std::string_view iid = account.substr(kIidOffset, kIidLength);
    if (!all_digits(iid)) return std::nullopt;
    int v = 0;
    for (unsigned char c : iid) v = v * 10 + (c - '0');
    return v;
}

// Expects a normalised account (no spaces, upper-case). Accounts whose
// IID is not numeric are never in the reserved band.
inline AccountKind classify_account(std::string_view account) {
    auto iid = institution_id(account);
    if (iid && *iid >= kReservedIidFirst && *iid <= kReservedIidLast)
        return AccountKind::Reserved;
    return AccountKind::Standard;
}

// QR-IBAN test for raw caller input (spaces allowed)
inline bool is_reserved_account(std::string_view account) {
    const std::string a = ascii_upper(strip_whitespace(account));
    if (a.size() != kAccountLength) return false;
    if (a.compare(0, 2, "CH") != 0 && a.compare(0, 2, "LI") != 0) return false;
    return classify_account(a) == AccountKind::Reserved;
}

inline bool is_qr_reference_shape(std::string_view ref) {
    return ref.size() == kQrReferenceLength && all_digits(ref);
}

// RF + 2 check digits + 1..21 alphanumerics
inline bool is_creditor_reference_shape(std::string_view ref) {
    if (ref.size() < kScorMinLength || ref.size() > kScorMaxLength) return false;
    if (ref.compare(0, 2, "RF") != 0) return false;
    return all_digits(ref.substr(2, 2)) && all_upper_alnum(ref.substr(4));
}

// Whitespace removed, upper-cased (ISO 11649 is case-insensitive)
inline std::string normalize_reference(std::string_view ref) {
    return ascii_upper(strip_whitespace(ref));
}

// Shape only, check digits are verified separately.
// nullopt = neither shape (invalid input, never None).
inline std::optional<ReferenceKind> classify_reference(std::string_view ref) {
    const std::string r = normalize_reference(ref);
    if (r.empty()) return ReferenceKind::None;
    if (is_qr_reference_shape(r)) return ReferenceKind::FixedNumeric;
    if (is_creditor_reference_shape(r)) return ReferenceKind::PrefixedAlphanumeric;
    return std::nullopt;
}

// Absent reference is None
inline std::optional<ReferenceKind> classify_optional_reference(const std::optional<std::string>& ref) {
    if (!ref) return ReferenceKind::None;
    return classify_reference(std::string_view(*ref));
}

// Total over AccountKind x ReferenceKind
inline PairingResult validate_pairing(AccountKind account, ReferenceKind reference) {
    switch (account) {
    case AccountKind::Reserved:
        switch (reference) {
        case ReferenceKind::FixedNumeric:         return PairingResult::Ok;
        case ReferenceKind::PrefixedAlphanumeric: return PairingResult::ReservedAccountRejectsPrefixedReference;
        case ReferenceKind::None:                 return PairingResult::ReservedAccountNeedsNumericReference;
        }
        break;
    case AccountKind::Standard:
        switch (reference) {
        case ReferenceKind::FixedNumeric:         return PairingResult::StandardAccountRejectsNumericReference;
        case ReferenceKind::PrefixedAlphanumeric: return PairingResult::Ok;
        case ReferenceKind::None:                 return PairingResult::Ok;
        }
        break;
    }
    return PairingResult::Ok;
}

inline const char* describe(PairingResult r) {
    switch (r) {
    case PairingResult::Ok:
        return "account and reference match";
    case PairingResult::ReservedAccountNeedsNumericReference:
        return "a QR-IBAN requires a QR reference (27 digits); use a regular IBAN to pay without reference";
    case PairingResult::ReservedAccountRejectsPrefixedReference:
        return "a creditor reference (RF...) cannot be used with a QR-IBAN; use a QR reference or a regular IBAN";
    case PairingResult::StandardAccountRejectsNumericReference:
        return "a QR reference (27 digits) requires a QR-IBAN; use a creditor reference (RF...) or no reference";
    }
    return "unknown pairing";
}

// Token for payload line 28
inline const char* reference_kind_token(ReferenceKind k) {
    switch (k) {
    case ReferenceKind::FixedNumeric:         return "QRR";
    case ReferenceKind::PrefixedAlphanumeric: return "SCOR";
    case ReferenceKind::None:                 return "NON";
    }
    return "NON";
}

} // namespace spc

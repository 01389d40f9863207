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
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>

namespace spc {

// --- Scheme constants ---
inline constexpr const char* kQrType        = "SPC";
inline constexpr const char* kVersion       = "0200";
inline constexpr const char* kCodingType    = "1";    // UTF-8, Latin-1 subset
inline constexpr const char* kAddressType   = "S";    // structured
inline constexpr const char* kTrailer       = "EPD";
inline constexpr const char* kLineSeparator = "\r\n";
inline constexpr std::size_t kPayloadLines  = 33;

inline constexpr std::size_t kAccountLength      = 21;
inline constexpr std::size_t kIidOffset          = 4;
inline constexpr std::size_t kIidLength          = 5;
inline constexpr int         kReservedIidFirst   = 30000;
inline constexpr int         kReservedIidLast    = 31999;
inline constexpr std::size_t kQrReferenceLength  = 27;
inline constexpr std::size_t kScorMinLength      = 5;
inline constexpr std::size_t kScorMaxLength      = 25;

inline constexpr std::size_t kMaxName        = 70;
inline constexpr std::size_t kMaxStreet      = 70;
inline constexpr std::size_t kMaxHouseNumber = 16;
inline constexpr std::size_t kMaxPostalCode  = 16;
inline constexpr std::size_t kMaxCity        = 35;
inline constexpr std::size_t kMaxMessage     = 140;

inline constexpr std::int64_t kMinAmountMinor = 1;            // 0.01
inline constexpr std::int64_t kMaxAmountMinor = 99999999999;  // 999'999'999.99

// --- Raw caller input (unvalidated) ---
struct AddressInput {
    std::string name;
    std::string street;
    std::optional<std::string> houseNumber;
    std::string postalCode;
    std::string city;
    std::string countryCode;  // ISO alpha-2, e.g. "CH"
};

struct CreditorInput {
    std::string account;      // IBAN or QR-IBAN, spaces allowed
    AddressInput address;
};

struct PaymentInput {
    CreditorInput creditor;
    std::optional<AddressInput> debtor;
    std::optional<double> amount;
    std::optional<std::string> currency;   // "CHF" if absent
    std::optional<std::string> reference;  // QRR (27 digits) or SCOR (RF...)
    std::optional<std::string> message;
};

// --- Validated values ---
struct Address {
    std::string name;
    std::string street;
    std::string houseNumber;  // empty if absent
    std::string postalCode;
    std::string city;
    std::string countryCode;  // upper-case
};

struct CurrencyAmount {
    std::string currency;     // "CHF" | "EUR"
    std::int64_t minor{0};    // Rappen / Cent
};

// Account kind from the institution identifier (IID)
enum class AccountKind { Reserved, Standard };  // Reserved = QR-IBAN

enum class ReferenceKind { FixedNumeric, PrefixedAlphanumeric, None };  // QRR, SCOR, NON

enum class PairingResult {
    Ok,
    ReservedAccountNeedsNumericReference,     // (Reserved, None)
    ReservedAccountRejectsPrefixedReference,  // (Reserved, PrefixedAlphanumeric)
    StandardAccountRejectsNumericReference    // (Standard, FixedNumeric)
};

// --- Errors ---
enum class ErrorKind {
    MissingRequiredField,
    FieldTooLong,
    InvalidAccountNumber,
    InvalidReferenceFormat,
    InvalidReferenceChecksum,
    IllegalAccountReferencePairing,
    AmountOutOfRange,
    UnsupportedCurrency,
    InvalidCountryCode
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
    case ErrorKind::MissingRequiredField:           return "MissingRequiredField";
    case ErrorKind::FieldTooLong:                   return "FieldTooLong";
    case ErrorKind::InvalidAccountNumber:           return "InvalidAccountNumber";
    case ErrorKind::InvalidReferenceFormat:         return "InvalidReferenceFormat";
    case ErrorKind::InvalidReferenceChecksum:       return "InvalidReferenceChecksum";
    case ErrorKind::IllegalAccountReferencePairing: return "IllegalAccountReferencePairing";
    case ErrorKind::AmountOutOfRange:               return "AmountOutOfRange";
    case ErrorKind::UnsupportedCurrency:            return "UnsupportedCurrency";
    case ErrorKind::InvalidCountryCode:             return "InvalidCountryCode";
    }
    return "Unknown";
}

// One failed check (pre-check collects these, construction throws the first)
struct Violation {
    ErrorKind kind{ErrorKind::MissingRequiredField};
    std::string field;        // e.g. "creditor.address.city"
    std::string message;
};

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(Violation v)
        : std::runtime_error(v.field + ": " + v.message), violation_(std::move(v)) {}

    ErrorKind kind() const noexcept { return violation_.kind; }
    const std::string& field() const noexcept { return violation_.field; }
    const Violation& violation() const noexcept { return violation_; }

private:
    Violation violation_;
};

// --- Display options (never applied to the payload) ---
struct DisplayOptions {
    char group_separator = ' ';       // account / reference grouping
    char thousands_separator = '\'';  // 1'234.50
    char decimal_separator = '.';
    std::size_t account_group = 4;
    std::size_t qr_reference_group = 5;
    std::size_t creditor_reference_group = 4;
};

} // namespace spc

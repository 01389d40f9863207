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
#include <cmath>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace spc {

// Receives failed checks. Without a collection target the first report
// throws (construction); with one, every report is appended (pre-check).
class Reporter {
public:
    Reporter() = default;
    explicit Reporter(std::vector<Violation>* collect) : collect_(collect) {}

    void report(ErrorKind kind, std::string field, std::string message) {
        Violation v{kind, std::move(field), std::move(message)};
        if (!collect_) throw ValidationError(std::move(v));
        collect_->push_back(std::move(v));
    }

private:
    std::vector<Violation>* collect_ = nullptr;
};

// Everything a document needs, already sanitized and checked
struct ValidatedPayment {
    std::string account;                 // no spaces, upper-case
    AccountKind accountKind{AccountKind::Standard};
    Address creditor;
    std::optional<Address> debtor;
    std::optional<std::int64_t> amountMinor;
    std::string currency{"CHF"};
    ReferenceKind referenceKind{ReferenceKind::None};
    std::string reference;               // empty for NON
    std::string message;                 // empty if absent
};

inline bool validate_text(std::string_view raw, const std::string& field,
                          std::size_t max_len, bool required,
                          std::string& out, Reporter& rep)
{
    out = sanitize(raw);
    if (out.empty()) {
        if (required) {
            rep.report(ErrorKind::MissingRequiredField, field, "is required");
            return false;
        }
        return true;
    }
    if (char_count(out) > max_len) {
        rep.report(ErrorKind::FieldTooLong, field,
                   "must not exceed " + std::to_string(max_len) + " characters");
        return false;
    }
    return true;
}

inline bool validate_country_code(std::string_view raw, const std::string& field,
                                  std::string& out, Reporter& rep)
{
    out = ascii_upper(sanitize(raw));
    if (out.empty()) {
        rep.report(ErrorKind::MissingRequiredField, field, "is required");
        return false;
    }
    if (out.size() != 2 ||
        out[0] < 'A' || out[0] > 'Z' || out[1] < 'A' || out[1] > 'Z') {
        rep.report(ErrorKind::InvalidCountryCode, field,
                   "must be a two-letter ISO country code (e.g. \"CH\")");
        return false;
    }
    return true;
}

// Structured address (type S). prefix: "creditor.address" / "debtor"
inline bool validate_address(const AddressInput& in, const std::string& prefix,
                             Address& out, Reporter& rep)
{
    bool ok = true;
    ok &= validate_text(in.name,       prefix + ".name",       kMaxName,       true, out.name, rep);
    ok &= validate_text(in.street,     prefix + ".street",     kMaxStreet,     true, out.street, rep);
    ok &= validate_text(in.houseNumber ? std::string_view(*in.houseNumber) : std::string_view(),
                        prefix + ".houseNumber", kMaxHouseNumber, false, out.houseNumber, rep);
    ok &= validate_text(in.postalCode, prefix + ".postalCode", kMaxPostalCode, true, out.postalCode, rep);
    ok &= validate_text(in.city,       prefix + ".city",       kMaxCity,       true, out.city, rep);
    ok &= validate_country_code(in.countryCode, prefix + ".countryCode", out.countryCode, rep);
    return ok;
}

// CH/LI IBAN or QR-IBAN, 21 characters, mod 97
inline bool validate_account(std::string_view raw, std::string& out, Reporter& rep)
{
    static const std::string field = "creditor.account";
    out = ascii_upper(strip_whitespace(raw));
    if (out.empty()) {
        rep.report(ErrorKind::MissingRequiredField, field, "is required");
        return false;
    }
    if (out.compare(0, 2, "CH") != 0 && out.compare(0, 2, "LI") != 0) {
        rep.report(ErrorKind::InvalidAccountNumber, field, "must start with \"CH\" or \"LI\"");
        return false;
    }
    if (out.size() != kAccountLength) {
        rep.report(ErrorKind::InvalidAccountNumber, field,
                   "must be 21 characters long (without spaces)");
        return false;
    }
    if (!all_digits(std::string_view(out).substr(2, 2)) ||
        !all_upper_alnum(std::string_view(out).substr(4))) {
        rep.report(ErrorKind::InvalidAccountNumber, field, "contains invalid characters");
        return false;
    }
    if (!iban_checksum_ok(out)) {
        rep.report(ErrorKind::InvalidAccountNumber, field, "check digits are invalid");
        return false;
    }
    return true;
}

inline bool validate_amount(const std::optional<double>& in,
                            std::optional<std::int64_t>& out, Reporter& rep)
{
    out.reset();
    if (!in) return true;
    const double a = *in;
    if (!std::isfinite(a) || a < 0.01 || a > 999999999.99) {
        rep.report(ErrorKind::AmountOutOfRange, "amount",
                   "must be between 0.01 and 999'999'999.99");
        return false;
    }
    std::int64_t minor = std::llround(a * 100.0);
    if (minor < kMinAmountMinor) minor = kMinAmountMinor;
    if (minor > kMaxAmountMinor) minor = kMaxAmountMinor;
    out = minor;
    return true;
}

inline bool validate_currency(const std::optional<std::string>& in,
                              std::string& out, Reporter& rep)
{
    out = in ? sanitize(*in) : std::string();
    if (out.empty()) {
        out = "CHF";
        return true;
    }
    if (out != "CHF" && out != "EUR") {
        rep.report(ErrorKind::UnsupportedCurrency, "currency", "must be CHF or EUR");
        return false;
    }
    return true;
}

// Shape, pairing with the account kind, then check digits.
// account_kind is nullopt when the account itself failed validation.
inline bool validate_reference(const std::optional<std::string>& in,
                               std::optional<AccountKind> account_kind,
                               std::string& out, ReferenceKind& kind, Reporter& rep)
{
    static const std::string field = "reference";
    out = in ? normalize_reference(*in) : std::string();
    auto k = classify_reference(out);
    if (!k) {
        rep.report(ErrorKind::InvalidReferenceFormat, field,
                   "must be a QR reference (27 digits) or a creditor reference (RF...)");
        return false;
    }
    kind = *k;

    bool ok = true;
    if (account_kind) {
        const PairingResult pr = validate_pairing(*account_kind, kind);
        if (pr != PairingResult::Ok) {
            rep.report(ErrorKind::IllegalAccountReferencePairing, field, describe(pr));
            ok = false;
        }
    }

    // Check digits are verified even after a pairing failure
    if (kind == ReferenceKind::FixedNumeric && !is_valid10(out)) {
        rep.report(ErrorKind::InvalidReferenceChecksum, field, "QR reference check digit is invalid");
        ok = false;
    }
    if (kind == ReferenceKind::PrefixedAlphanumeric && !creditor_reference_ok(out)) {
        rep.report(ErrorKind::InvalidReferenceChecksum, field, "creditor reference check digits are invalid");
        ok = false;
    }
    return ok;
}

inline bool validate_message(const std::optional<std::string>& in,
                             std::string& out, Reporter& rep)
{
    out.clear();
    if (!in) return true;
    return validate_text(*in, "message", kMaxMessage, false, out, rep);
}

// Runs every check in a fixed order. With a fail-fast Reporter the first
// violation throws; with a collecting one all checks run.
inline bool validate_payment(const PaymentInput& in, ValidatedPayment& out, Reporter& rep)
{
    bool ok = true;

    std::optional<AccountKind> account_kind;
    if (validate_account(in.creditor.account, out.account, rep)) {
        out.accountKind = classify_account(out.account);
        account_kind = out.accountKind;
    } else {
        ok = false;
    }

    ok &= validate_reference(in.reference, account_kind, out.reference, out.referenceKind, rep);
    ok &= validate_address(in.creditor.address, "creditor.address", out.creditor, rep);
    ok &= validate_amount(in.amount, out.amountMinor, rep);
    ok &= validate_currency(in.currency, out.currency, rep);

    out.debtor.reset();
    if (in.debtor) {
        Address d;
        if (validate_address(*in.debtor, "debtor", d, rep)) out.debtor = std::move(d);
        else ok = false;
    }

    ok &= validate_message(in.message, out.message, rep);
    return ok;
}

// Fail-collect pre-check: every violation, empty if the input is valid
inline std::vector<Violation> check_payment(const PaymentInput& in) {
    std::vector<Violation> all;
    Reporter rep(&all);
    ValidatedPayment scratch;
    validate_payment(in, scratch, rep);
    return all;
}

} // namespace spc

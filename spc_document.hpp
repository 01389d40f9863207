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
#include "spc_validate.hpp"
#include <string>
#include <vector>
#include <optional>
#include <iomanip>
#include <sstream>

namespace spc {

// Validated, immutable payment. Only obtainable through create()/try_create().
class PaymentDocument {
public:
    // Throws ValidationError on the first violation
    static PaymentDocument create(const PaymentInput& in) {
        ValidatedPayment v;
        Reporter fail_fast;
        validate_payment(in, v, fail_fast);
        return PaymentDocument(std::move(v));
    }

    static bool try_create(const PaymentInput& in, std::optional<PaymentDocument>& out,
                           std::string* error = nullptr) {
        out.reset();
        try {
            out.emplace(create(in));
            return true;
        } catch (const ValidationError& e) {
            if (error) *error = e.what();
            return false;
        }
    }

    const std::string& account() const { return v_.account; }
    AccountKind account_kind() const { return v_.accountKind; }
    const Address& creditor() const { return v_.creditor; }
    const std::optional<Address>& debtor() const { return v_.debtor; }
    const std::string& currency() const { return v_.currency; }
    ReferenceKind reference_kind() const { return v_.referenceKind; }
    const std::string& reference() const { return v_.reference; }
    const std::string& message() const { return v_.message; }

    std::optional<CurrencyAmount> amount() const {
        if (!v_.amountMinor) return std::nullopt;
        return CurrencyAmount{v_.currency, *v_.amountMinor};
    }

    std::string payload() const;

private:
    explicit PaymentDocument(ValidatedPayment v) : v_(std::move(v)) {}

    ValidatedPayment v_;
};

// minor units -> "1234.50" (payload form: no grouping, '.' separator)
inline std::string payload_amount(std::int64_t minor) {
    std::ostringstream oss;
    oss << minor / 100 << '.' << std::setw(2) << std::setfill('0') << minor % 100;
    return oss.str();
}

inline void append_address(std::vector<std::string>& lines, const Address& a) {
    lines.push_back(kAddressType);
    lines.push_back(a.name);
    lines.push_back(a.street);
    lines.push_back(a.houseNumber);
    lines.push_back(a.postalCode);
    lines.push_back(a.city);
    lines.push_back(a.countryCode);
}

// Line layout of the 33-line payload
inline std::vector<std::string> payload_lines(const PaymentDocument& doc) {
    std::vector<std::string> lines;
    lines.reserve(kPayloadLines);

    // Header
    lines.push_back(kQrType);                                   // 1
    lines.push_back(kVersion);                                  // 2
    lines.push_back(kCodingType);                               // 3

    // Creditor
    lines.push_back(doc.account());                             // 4
    append_address(lines, doc.creditor());                      // 5-11

    // Ultimate creditor (reserved, always empty)
    lines.insert(lines.end(), 7, std::string());                // 12-18

    // Amount
    auto amt = doc.amount();
    lines.push_back(amt ? payload_amount(amt->minor) : std::string()); // 19
    lines.push_back(doc.currency());                            // 20

    // Debtor
    if (doc.debtor()) append_address(lines, *doc.debtor());     // 21-27
    else lines.insert(lines.end(), 7, std::string());

    // Reference
    lines.push_back(reference_kind_token(doc.reference_kind())); // 28
    lines.push_back(doc.reference());                           // 29

    // Additional information
    lines.push_back(doc.message());                             // 30
    lines.push_back(kTrailer);                                  // 31

    // Alternative procedures
    lines.insert(lines.end(), 2, std::string());                // 32-33
    return lines;
}

inline std::string serialize(const PaymentDocument& doc) {
    const std::vector<std::string> lines = payload_lines(doc);
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out.append(kLineSeparator);
        out.append(lines[i]);
    }
    return out;
}

inline std::string PaymentDocument::payload() const { return serialize(*this); }

} // namespace spc

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "spc.hpp"

namespace spc_test {

// Valid accounts (mod 97 == 1)
inline const char* kQrIban        = "CH4431999123000889012";   // IID 31999, reserved
inline const char* kQrIbanLow     = "CH5730000123456789012";   // IID 30000, reserved
inline const char* kIban          = "CH9300762011623852957";   // IID 00762, standard
inline const char* kIbanBelowBand = "CH2329999000000000001";   // IID 29999
inline const char* kIbanAboveBand = "CH2632000000000000001";   // IID 32000
inline const char* kLiIban        = "LI0608800000002324013";

// Valid references
inline const char* kQrReference       = "000000000000000000012345676";
inline const char* kQrReferenceSix    = "210000000003139471430009017";
inline const char* kCreditorReference = "RF18539007547034";

inline bool Expect(bool cond, const char* label) {
    if (!cond) std::cerr << label << ": failed\n";
    return cond;
}

inline bool ExpectEq(const std::string& actual, const std::string& expected, const char* label) {
    if (actual != expected) {
        std::cerr << label << ": got \"" << actual << "\", expected \"" << expected << "\"\n";
        return false;
    }
    return true;
}

inline spc::AddressInput Address(const std::string& name = "Robert Schneider AG") {
    spc::AddressInput a;
    a.name = name;
    a.street = "Rue du Lac";
    a.houseNumber = std::string("1268");
    a.postalCode = "2501";
    a.city = "Biel";
    a.countryCode = "CH";
    return a;
}

inline spc::PaymentInput Payment(const std::string& account,
                                 const std::string& reference = std::string()) {
    spc::PaymentInput in;
    in.creditor.account = account;
    in.creditor.address = Address();
    if (!reference.empty()) in.reference = reference;
    return in;
}

// Kind of the error create() throws, or nothing if it succeeds
inline bool ExpectError(const spc::PaymentInput& in, spc::ErrorKind kind,
                        const std::string& field, const char* label) {
    try {
        (void)spc::PaymentDocument::create(in);
    } catch (const spc::ValidationError& e) {
        if (e.kind() != kind) {
            std::cerr << label << ": got " << spc::error_kind_name(e.kind())
                      << ", expected " << spc::error_kind_name(kind) << " (" << e.what() << ")\n";
            return false;
        }
        if (e.field() != field) {
            std::cerr << label << ": field \"" << e.field() << "\", expected \"" << field << "\"\n";
            return false;
        }
        return true;
    }
    std::cerr << label << ": accepted, expected " << spc::error_kind_name(kind) << "\n";
    return false;
}

inline std::vector<std::string> SplitLines(const std::string& payload) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = payload.find("\r\n", start);
        if (pos == std::string::npos) {
            out.push_back(payload.substr(start));
            break;
        }
        out.push_back(payload.substr(start, pos - start));
        start = pos + 2;
    }
    return out;
}

}  // namespace spc_test

#include <iostream>
#include <string>

#include "test_fixtures.hpp"

using spc_test::Expect;
using spc_test::ExpectEq;

int main() {
  using namespace spc;

  // Streaming remainder matches the known value for a 100-digit number.
  {
    std::string big;
    for (int i = 0; i < 10; ++i) big += "1234567890";
    auto rem = mod97(big);
    if (!Expect(rem && *rem == 65, "mod97 of 100 digits")) return 1;
    auto check = compute_check97(big);
    if (!Expect(check && *check == "97", "check97 of 100 digits")) return 1;
    if (!Expect(is_valid97(big + *check), "100 digits + check valid")) return 1;
  }

  if (!Expect(!mod97("12-34"), "mod97 rejects punctuation")) return 1;
  if (!Expect(!mod97("ch93"), "mod97 rejects lower case")) return 1;
  if (!Expect(mod97("") && *mod97("") == 0, "mod97 of empty string")) return 1;

  // Round trip over a range of digit strings.
  {
    std::string d;
    for (int i = 0; i < 40; ++i) {
      d.push_back(static_cast<char>('0' + (i * 7) % 10));
      auto check = compute_check97(d);
      if (!check || !is_valid97(d + *check)) {
        std::cerr << "check97 round trip failed for " << d << "\n";
        return 1;
      }
    }
  }

  // Account numbers.
  if (!Expect(iban_checksum_ok(spc_test::kQrIban), "QR-IBAN checksum")) return 1;
  if (!Expect(iban_checksum_ok(spc_test::kIban), "IBAN checksum")) return 1;
  if (!Expect(iban_checksum_ok(spc_test::kLiIban), "LI IBAN checksum")) return 1;
  if (!Expect(!iban_checksum_ok("CH4431999123000889013"), "altered last digit")) return 1;
  if (!Expect(!iban_checksum_ok("CH4413999123000889012"), "swapped digits")) return 1;
  {
    auto check = rotated_check_digits("CH", "00762011623852957");
    if (!Expect(check && *check == "93", "IBAN check digits")) return 1;
  }

  // Creditor references.
  if (!Expect(creditor_reference_ok(spc_test::kCreditorReference), "RF reference")) return 1;
  if (!Expect(!creditor_reference_ok("RF19539007547034"), "RF wrong check")) return 1;

  // Modulo 10 recursive: every single digit, table row by row.
  {
    const int expected[10] = {0, 1, 6, 4, 2, 8, 3, 9, 7, 5};
    for (int dgt = 0; dgt < 10; ++dgt) {
      auto check = compute_check10(std::string(1, static_cast<char>('0' + dgt)));
      if (!check || *check != expected[dgt]) {
        std::cerr << "check10 of single digit " << dgt << " wrong\n";
        return 1;
      }
    }
  }
  if (!Expect(is_valid10(spc_test::kQrReferenceSix), "SIX sample reference")) return 1;
  if (!Expect(is_valid10(spc_test::kQrReference), "fixture reference")) return 1;
  if (!Expect(!is_valid10("000000000000000000012345679"), "wrong check digit rejected")) return 1;
  if (!Expect(!is_valid10(""), "empty not valid")) return 1;
  if (!Expect(!compute_check10("12a"), "check10 rejects letters")) return 1;
  {
    auto check = compute_check10("00000000000000000001234567");
    if (!Expect(check && *check == 6, "check10 of 26-digit body")) return 1;
  }

  // Round trip for every 26-digit body built from a running pattern.
  {
    for (int start = 0; start < 10; ++start) {
      std::string d;
      for (int i = 0; i < 26; ++i) d.push_back(static_cast<char>('0' + (start + i * 3) % 10));
      auto check = compute_check10(d);
      if (!check || !is_valid10(d + std::to_string(*check))) {
        std::cerr << "check10 round trip failed for " << d << "\n";
        return 1;
      }
    }
  }

  if (!ExpectEq(std::to_string(*compute_check10("21000000000313947143000901")), "7",
                "SIX sample check digit")) return 1;

  std::cout << "checksum tests passed\n";
  return 0;
}

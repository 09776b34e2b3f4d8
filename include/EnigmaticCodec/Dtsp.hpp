#pragma once
// Dtsp.hpp – Static fee-plane alphabet for plain-text signaling.
//
// Each upper-case letter, digit and a small punctuation set maps to one exact
// amount in minor units, together with the START / ACCEPT / END control codes
// used to frame an exchange. The mapping is fixed; there is nothing to load.
//
// Usage example:
//   std::vector<Amount> fees = dtsp::encodeText("Hello World");
//   std::string text         = dtsp::decodeAmounts(fees);   // "HELLO WORLD"

#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace enigmatic::dtsp {

class DtspError : public std::runtime_error {
public:
    explicit DtspError(const std::string& msg) : std::runtime_error(msg) {}
};

// ─── Alphabet ─────────────────────────────────────────────────────────────────
inline constexpr Amount kLetterBase  = 22659; // 'A'; 'Z' = 22684
inline constexpr Amount kDigitBase   = 22648; // '0'; '9' = 22657
inline constexpr Amount kSpecialBase = 22688; // first of kSpecials
inline constexpr const char* kSpecials = " .,!?:=+-*/_";

inline constexpr Amount kStart  = 22611;
inline constexpr Amount kAccept = 22631;
inline constexpr Amount kEnd    = 22621;

struct Entry {
    std::string key;    // single character, or "START" / "ACCEPT" / "END"
    Amount      amount{0};
};

// Every alphabet entry: letters, digits, specials, then control codes.
[[nodiscard]] const std::vector<Entry>& alphabet();

// Amount for a single character (letters are upper-cased first).
[[nodiscard]] std::optional<Amount> amountFor(char c);

struct Closest {
    std::optional<std::string> key;   // nullopt when outside tolerance
    Amount                     error{0};
};

// Nearest alphabet entry to `value`; `key` is set only when the distance is
// within `tolerance` minor units.
[[nodiscard]] Closest closestSymbol(Amount value, Amount tolerance = 0);

// Encode `text`. Throws DtspError on characters outside the alphabet.
[[nodiscard]] std::vector<Amount> encodeText(const std::string& text, bool with_start_end = true);

// Decode amounts back to text. Unknown amounts become '?', control codes in
// the body become their lower-case names. With `require_start_end`, a missing
// START or END marker throws DtspError.
[[nodiscard]] std::string decodeAmounts(const std::vector<Amount>& values,
                                        bool require_start_end = true,
                                        Amount tolerance = 0);

// "symbol | amount" table, one row per entry, sorted by key.
[[nodiscard]] std::string formatTable();

} // namespace enigmatic::dtsp

#pragma once
// BinaryPackets.hpp – Value-plane text carrier: one character per output.
//
// A character's code point is written as a fixed-width bit string directly
// after the decimal point of the output amount, on top of a base amount:
//   'A' = 01000001  ->  0.0001 + 0.01000001  =  0.01010001
// Decoding strips the base and reads the bit string back. The whole-coin
// part of an amount carries no information.
//
// Usage example:
//   auto packets     = binpack::encodeText("Hi");
//   std::string text = binpack::decodeAmounts(binpack::amountsOf(packets));

#include "Types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace enigmatic::binpack {

class BinaryPacketError : public std::runtime_error {
public:
    explicit BinaryPacketError(const std::string& msg) : std::runtime_error(msg) {}
};

inline constexpr Amount kDefaultBase        = 10'000; // 0.0001
inline constexpr int    kDefaultBitsPerChar = 8;
inline constexpr int    kMaxBitsPerChar     = 8;      // minor units carry 8 decimals

struct BinaryPacket {
    char        letter{0};
    std::string bits;      // bits_per_char characters of '0' / '1'
    Amount      amount{0};
};

// One packet per byte of `text`. Throws BinaryPacketError when a byte does
// not fit in `bits_per_char` bits, when `bits_per_char` is outside
// 1..kMaxBitsPerChar, or when `base` is negative.
[[nodiscard]] std::vector<BinaryPacket> encodeText(const std::string& text,
                                                   Amount base          = kDefaultBase,
                                                   int    bits_per_char = kDefaultBitsPerChar);

// Inverse of encodeText. Throws BinaryPacketError for an amount below `base`
// or one whose fractional digits are not all binary.
[[nodiscard]] std::string decodeAmounts(const std::vector<Amount>& amounts,
                                        Amount base          = kDefaultBase,
                                        int    bits_per_char = kDefaultBitsPerChar);

[[nodiscard]] std::vector<Amount> amountsOf(const std::vector<BinaryPacket>& packets);

// "letter | bits | amount" table, one row per packet.
[[nodiscard]] std::string formatPackets(const std::vector<BinaryPacket>& packets);

} // namespace enigmatic::binpack

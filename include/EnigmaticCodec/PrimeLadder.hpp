#pragma once
// PrimeLadder.hpp – Prime-ratio ladder steps on the value plane.
//
// A ladder step is the ratio of two consecutive primes from kPrimeSequence,
// rounded to a number of decimals and expressed in minor units
// (41/47 = 0.87234043 -> 87'234'043). Recognition matches an observed amount
// against every step of a prime list.

#include "Types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace enigmatic::ladder {

class PrimeLadderError : public std::runtime_error {
public:
    explicit PrimeLadderError(const std::string& msg) : std::runtime_error(msg) {}
};

inline constexpr std::array<uint32_t, 10> kPrimeSequence = {41, 47, 53, 59, 61, 67, 71, 73, 79, 83};
inline constexpr int kMaxDecimals = 8;

struct LadderStep {
    size_t   index{0};
    uint32_t p{0};
    uint32_t q{0};
    Amount   ratio{0};   // minor units
};

// p / q rounded half-up to `decimals` places. Throws PrimeLadderError for
// q == 0 or `decimals` outside 0..kMaxDecimals.
[[nodiscard]] Amount primeRatio(uint32_t p, uint32_t q, int decimals = kMaxDecimals);

// kPrimeSequence[index] / kPrimeSequence[index + 1]. Throws PrimeLadderError
// when index + 1 is past the end of the sequence.
[[nodiscard]] Amount ladderStepRatio(size_t index, int decimals = kMaxDecimals);

// Every consecutive pair of kPrimeSequence with its ratio.
[[nodiscard]] std::vector<LadderStep> primePairs(int decimals = kMaxDecimals);

// First step of `primes` (kPrimeSequence when empty) whose ratio lies within
// `tolerance` minor units of `value`.
[[nodiscard]] std::optional<LadderStep> matchPrimeRatio(Amount value,
                                                        Amount tolerance = 0,
                                                        int decimals = kMaxDecimals,
                                                        const std::vector<uint32_t>& primes = {});

} // namespace enigmatic::ladder

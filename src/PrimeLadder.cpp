// PrimeLadder.cpp – Prime-ratio steps in exact minor units.

#include "EnigmaticCodec/PrimeLadder.hpp"

#include <cstdlib>

namespace enigmatic::ladder {

Amount primeRatio(uint32_t p, uint32_t q, int decimals) {
    if (q == 0)
        throw PrimeLadderError("Denominator must be non-zero for prime ratios");
    if (decimals < 0 || decimals > kMaxDecimals)
        throw PrimeLadderError("decimals must be in 0.." + std::to_string(kMaxDecimals) +
                               ", got " + std::to_string(decimals));

    Amount scale = 1;
    for (int i = 0; i < decimals; ++i) scale *= 10;

    // Half-up rounding on exact integers: (2*p*scale + q) / (2*q).
    const Amount rounded = (2 * static_cast<Amount>(p) * scale + q) / (2 * static_cast<Amount>(q));
    return rounded * (kMinorUnitsPerCoin / scale);
}

Amount ladderStepRatio(size_t index, int decimals) {
    if (index + 1 >= kPrimeSequence.size())
        throw PrimeLadderError("Prime ladder index " + std::to_string(index) +
                               " is out of range for the configured sequence");
    return primeRatio(kPrimeSequence[index], kPrimeSequence[index + 1], decimals);
}

std::vector<LadderStep> primePairs(int decimals) {
    std::vector<LadderStep> steps;
    for (size_t i = 0; i + 1 < kPrimeSequence.size(); ++i)
        steps.push_back({i, kPrimeSequence[i], kPrimeSequence[i + 1],
                         primeRatio(kPrimeSequence[i], kPrimeSequence[i + 1], decimals)});
    return steps;
}

std::optional<LadderStep> matchPrimeRatio(Amount value, Amount tolerance, int decimals,
                                          const std::vector<uint32_t>& primes) {
    const std::vector<uint32_t> list = primes.empty()
        ? std::vector<uint32_t>(kPrimeSequence.begin(), kPrimeSequence.end())
        : primes;

    for (size_t i = 0; i + 1 < list.size(); ++i) {
        const Amount ratio = primeRatio(list[i], list[i + 1], decimals);
        if (std::llabs(value - ratio) <= tolerance)
            return LadderStep{i, list[i], list[i + 1], ratio};
    }
    return std::nullopt;
}

} // namespace enigmatic::ladder

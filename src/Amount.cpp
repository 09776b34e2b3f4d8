// Amount.cpp – Exact decimal <-> minor-unit conversion.

#include "EnigmaticCodec/Types.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace enigmatic {

namespace {

bool allDigits(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

std::optional<Amount> parseAmount(const std::string& text) {
    if (text.empty())
        return std::nullopt;

    bool negative = false;
    size_t pos    = 0;
    if (text[0] == '-') {
        negative = true;
        pos      = 1;
    }

    const size_t dot   = text.find('.', pos);
    const std::string whole = text.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
    const std::string frac  = dot == std::string::npos ? std::string{} : text.substr(dot + 1);

    if (whole.empty() && frac.empty())
        return std::nullopt;
    if (frac.size() > 8 || !allDigits(whole) || !allDigits(frac))
        return std::nullopt;

    Amount units = 0;
    if (!whole.empty()) {
        auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), units);
        if (ec != std::errc{} || ptr != whole.data() + whole.size())
            return std::nullopt;
    }

    Amount fraction = 0;
    if (!frac.empty()) {
        auto [ptr, ec] = std::from_chars(frac.data(), frac.data() + frac.size(), fraction);
        if (ec != std::errc{} || ptr != frac.data() + frac.size())
            return std::nullopt;
        for (size_t i = frac.size(); i < 8; ++i)
            fraction *= 10;
    }

    if (units > (std::numeric_limits<Amount>::max() - fraction) / kMinorUnitsPerCoin)
        return std::nullopt;

    Amount total = units * kMinorUnitsPerCoin + fraction;
    return negative ? -total : total;
}

std::string formatAmount(Amount amount) {
    std::string sign;
    if (amount < 0) {
        sign   = "-";
        amount = -amount;
    }
    std::string frac = std::to_string(amount % kMinorUnitsPerCoin);
    frac.insert(0, 8 - frac.size(), '0');
    return sign + std::to_string(amount / kMinorUnitsPerCoin) + "." + frac;
}

const char* symmetryName(Symmetry s) {
    switch (s) {
    case Symmetry::Mirrored:   return "mirrored";
    case Symmetry::Neutral:    return "neutral";
    case Symmetry::Asymmetric: return "asymmetric";
    }
    return "unknown";
}

} // namespace enigmatic

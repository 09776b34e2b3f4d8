// BinaryPackets.cpp – Bit strings in the decimal places of output amounts.

#include "EnigmaticCodec/BinaryPackets.hpp"

namespace enigmatic::binpack {

namespace {

// Minor units per decimal place of the bit string's last digit.
Amount quantumFor(int bits_per_char) {
    if (bits_per_char <= 0 || bits_per_char > kMaxBitsPerChar)
        throw BinaryPacketError("bits_per_char must be in 1.." + std::to_string(kMaxBitsPerChar) +
                                ", got " + std::to_string(bits_per_char));
    Amount q = 1;
    for (int i = bits_per_char; i < kMaxBitsPerChar; ++i)
        q *= 10;
    return q;
}

void checkBase(Amount base) {
    if (base < 0)
        throw BinaryPacketError("Base amount must not be negative: " + formatAmount(base));
}

} // namespace

std::vector<BinaryPacket> encodeText(const std::string& text, Amount base, int bits_per_char) {
    const Amount quantum = quantumFor(bits_per_char);
    checkBase(base);

    std::vector<BinaryPacket> packets;
    packets.reserve(text.size());
    for (char c : text) {
        const unsigned codepoint = static_cast<unsigned char>(c);
        if (codepoint >= (1u << bits_per_char))
            throw BinaryPacketError("Character code " + std::to_string(codepoint) +
                                    " cannot be represented with " +
                                    std::to_string(bits_per_char) + " bits");

        BinaryPacket p;
        p.letter = c;
        Amount digits = 0;
        for (int bit = bits_per_char - 1; bit >= 0; --bit) {
            const bool set = (codepoint >> bit) & 1u;
            p.bits += set ? '1' : '0';
            digits = digits * 10 + (set ? 1 : 0);
        }
        p.amount = (base + digits * quantum) / quantum * quantum;
        packets.push_back(std::move(p));
    }
    return packets;
}

std::string decodeAmounts(const std::vector<Amount>& amounts, Amount base, int bits_per_char) {
    const Amount quantum = quantumFor(bits_per_char);
    checkBase(base);

    std::string text;
    text.reserve(amounts.size());
    for (Amount amount : amounts) {
        if (amount < base)
            throw BinaryPacketError("Amount " + formatAmount(amount) + " is below the base " +
                                    formatAmount(base));

        Amount digits = (amount - base) % kMinorUnitsPerCoin / quantum;
        unsigned codepoint = 0;
        unsigned weight    = 1;
        for (int i = 0; i < bits_per_char; ++i, digits /= 10, weight <<= 1) {
            const Amount d = digits % 10;
            if (d > 1)
                throw BinaryPacketError("Amount " + formatAmount(amount) +
                                        " contains non-binary decimal digits");
            codepoint += static_cast<unsigned>(d) * weight;
        }
        text += static_cast<char>(codepoint);
    }
    return text;
}

std::vector<Amount> amountsOf(const std::vector<BinaryPacket>& packets) {
    std::vector<Amount> out;
    out.reserve(packets.size());
    for (const auto& p : packets) out.push_back(p.amount);
    return out;
}

std::string formatPackets(const std::vector<BinaryPacket>& packets) {
    std::string out = "letter | bits | amount";
    for (const auto& p : packets)
        out += "\n" + std::string(1, p.letter) + " | " + p.bits + " | " + formatAmount(p.amount);
    return out;
}

} // namespace enigmatic::binpack

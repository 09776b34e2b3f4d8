// Dtsp.cpp – Fee-plane alphabet lookups and text codec.

#include "EnigmaticCodec/Dtsp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace enigmatic::dtsp {

const std::vector<Entry>& alphabet() {
    static const std::vector<Entry> table = [] {
        std::vector<Entry> t;
        for (int i = 0; i < 26; ++i)
            t.push_back({std::string(1, static_cast<char>('A' + i)), kLetterBase + i});
        for (int i = 0; i < 10; ++i)
            t.push_back({std::string(1, static_cast<char>('0' + i)), kDigitBase + i});
        const size_t n = std::strlen(kSpecials);
        for (size_t i = 0; i < n; ++i)
            t.push_back({std::string(1, kSpecials[i]), kSpecialBase + static_cast<Amount>(i)});
        t.push_back({"START", kStart});
        t.push_back({"ACCEPT", kAccept});
        t.push_back({"END", kEnd});
        return t;
    }();
    return table;
}

std::optional<Amount> amountFor(char c) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) c = static_cast<char>(std::toupper(uc));
    for (const auto& e : alphabet())
        if (e.key.size() == 1 && e.key[0] == c) return e.amount;
    return std::nullopt;
}

Closest closestSymbol(Amount value, Amount tolerance) {
    Closest best;
    best.error = std::numeric_limits<Amount>::max();
    const Entry* hit = nullptr;
    for (const auto& e : alphabet()) {
        const Amount err = std::llabs(value - e.amount);
        if (err < best.error) {
            best.error = err;
            hit        = &e;
        }
    }
    if (hit && best.error <= tolerance) best.key = hit->key;
    return best;
}

std::vector<Amount> encodeText(const std::string& text, bool with_start_end) {
    std::vector<Amount> out;
    if (with_start_end) out.push_back(kStart);
    for (char c : text) {
        auto a = amountFor(c);
        if (!a)
            throw DtspError("Unsupported character for DTSP: '" + std::string(1, c) + "'");
        out.push_back(*a);
    }
    if (with_start_end) out.push_back(kEnd);
    return out;
}

std::string decodeAmounts(const std::vector<Amount>& values, bool require_start_end, Amount tolerance) {
    size_t begin = 0;
    size_t end   = values.size();

    if (require_start_end) {
        if (values.empty())
            throw DtspError("DTSP sequence is empty; START/END missing");
        const auto first = closestSymbol(values.front(), tolerance);
        const auto last  = closestSymbol(values.back(), tolerance);
        if (first.key != "START" || last.key != "END" || values.size() < 2)
            throw DtspError("START/END handshake markers not found");
        begin = 1;
        end   = values.size() - 1;
    }

    std::string text;
    for (size_t i = begin; i < end; ++i) {
        const auto c = closestSymbol(values[i], tolerance);
        if (!c.key) {
            text += '?';
        } else if (c.key->size() > 1) {
            std::string lower = *c.key;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            text += lower;
        } else {
            text += *c.key;
        }
    }
    return text;
}

std::string formatTable() {
    std::vector<Entry> rows = alphabet();
    std::sort(rows.begin(), rows.end(), [](const Entry& a, const Entry& b) { return a.key < b.key; });

    std::string out = "symbol | amount";
    for (const auto& e : rows)
        out += "\n" + e.key + " | " + formatAmount(e.amount);
    return out;
}

} // namespace enigmatic::dtsp

// Projector.cpp – State vector projection.

#include "EnigmaticCodec/Projector.hpp"

#include <algorithm>

namespace enigmatic {

// Anchors take precedence over micros; within a role, output order decides.
std::optional<size_t> Projector::headerIndex(const ObservedTx& tx) const {
    for (ValueRole role : {ValueRole::Anchor, ValueRole::Micro}) {
        for (size_t i = 0; i < tx.outputs.size(); ++i) {
            for (const auto& [name, h] : dialect_.headers) {
                if (h.role == role && h.amount == tx.outputs[i].amount)
                    return i;
            }
        }
    }
    return std::nullopt;
}

std::optional<size_t> Projector::designatedChange(const ObservedTx& tx) const {
    const auto header = headerIndex(tx);
    std::optional<size_t> best;
    for (size_t i = 0; i < tx.outputs.size(); ++i) {
        if (header && *header == i) continue;
        if (!best || tx.outputs[i].amount >= tx.outputs[*best].amount)
            best = i;
    }
    return best;
}

Symmetry Projector::classifySymmetry(const ObservedTx& tx) const {
    const size_t in  = tx.inputs.size();
    const size_t out = tx.outputs.size();
    const size_t spread = in > out ? in - out : out - in;

    if (spread > dialect_.asymmetry_threshold)
        return Symmetry::Asymmetric;

    if (in == out) {
        const bool canonical = std::is_sorted(
            tx.outputs.begin(), tx.outputs.end(),
            [](const TxOutput& a, const TxOutput& b) { return a.amount < b.amount; });
        if (canonical)
            return Symmetry::Mirrored;
    }
    return Symmetry::Neutral;
}

StateVector Projector::project(const ObservedTx& tx, std::optional<int64_t> prior_height) const {
    StateVector sv;

    if (auto idx = headerIndex(tx)) {
        sv.value = tx.outputs[*idx].amount;
    } else if (!tx.outputs.empty()) {
        sv.value = std::min_element(tx.outputs.begin(), tx.outputs.end(),
                                    [](const TxOutput& a, const TxOutput& b) {
                                        return a.amount < b.amount;
                                    })->amount;
    }

    sv.fee       = tx.fee;
    sv.in_count  = static_cast<uint32_t>(tx.inputs.size());
    sv.out_count = static_cast<uint32_t>(tx.outputs.size());
    sv.symmetry  = classifySymmetry(tx);

    if (prior_height)
        sv.block_delta = tx.height - *prior_height;

    if (!tx.aux.empty())
        sv.aux = tx.aux;

    return sv;
}

} // namespace enigmatic

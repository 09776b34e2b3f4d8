// PacketGrouper.cpp – Gap-based packet boundaries.

#include "EnigmaticCodec/PacketGrouper.hpp"

namespace enigmatic {

int64_t PacketGrouper::mark(const ObservedTx& tx) const noexcept {
    return policy_.unit == GapUnit::Height ? tx.height : tx.timestamp;
}

std::optional<Packet> PacketGrouper::push(ObservedTx tx) {
    const int64_t m = mark(tx);
    std::optional<Packet> closed;

    if (!current_.txs.empty() && m - last_mark_ > policy_.threshold) {
        closed = std::move(current_);
        current_.txs.clear();
    }

    current_.txs.push_back(std::move(tx));
    last_mark_ = m;
    return closed;
}

std::optional<Packet> PacketGrouper::flush() {
    if (current_.txs.empty())
        return std::nullopt;
    Packet out = std::move(current_);
    current_.txs.clear();
    return out;
}

std::vector<Packet> PacketGrouper::drain(ObservationSource& source) {
    std::vector<Packet> packets;
    while (auto tx = source.next()) {
        if (auto closed = push(std::move(*tx)))
            packets.push_back(std::move(*closed));
    }
    if (auto last = flush())
        packets.push_back(std::move(*last));
    return packets;
}

std::vector<Packet> groupIntoPackets(std::vector<ObservedTx> txs, GapPolicy policy) {
    VectorSource source{std::move(txs)};
    PacketGrouper grouper{policy};
    return grouper.drain(source);
}

} // namespace enigmatic

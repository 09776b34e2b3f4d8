#pragma once
// PacketGrouper.hpp – Splits an ordered observation stream into packets.
//
// Two consecutive observations whose height (or timestamp) difference is at
// most the gap threshold share a packet; one unit more starts a new packet.
//
// The grouper is driven either by push() from a live poller or by drain() over
// an ObservationSource. A push-style feed has no natural end, so the last open
// packet is only emitted by the next out-of-gap observation or by an explicit
// flush(); callers polling a live node must decide when "idle" means flush.

#include "Types.hpp"

#include <optional>
#include <vector>

namespace enigmatic {

// Pull-based producer of observations. next() returns nullopt when the source
// has nothing more to give (end of a replay, or an idle live feed).
class ObservationSource {
public:
    virtual ~ObservationSource() = default;
    virtual std::optional<ObservedTx> next() = 0;
};

// Finite replay over a vector; used for batch decode and tests.
class VectorSource : public ObservationSource {
public:
    explicit VectorSource(std::vector<ObservedTx> txs) : txs_(std::move(txs)) {}

    std::optional<ObservedTx> next() override {
        if (pos_ >= txs_.size()) return std::nullopt;
        return txs_[pos_++];
    }

private:
    std::vector<ObservedTx> txs_;
    size_t                  pos_{0};
};

class PacketGrouper {
public:
    explicit PacketGrouper(GapPolicy policy) noexcept : policy_(policy) {}

    // Add one observation. Returns the packet it closed, if any.
    [[nodiscard]] std::optional<Packet> push(ObservedTx tx);

    // Emit the open packet (if any) and reset.
    [[nodiscard]] std::optional<Packet> flush();

    // Pull every observation from `source`, then flush. Packets come back in
    // stream order.
    [[nodiscard]] std::vector<Packet> drain(ObservationSource& source);

    [[nodiscard]] bool   hasOpenPacket() const noexcept { return !current_.txs.empty(); }
    [[nodiscard]] size_t openSize()      const noexcept { return current_.txs.size(); }
    [[nodiscard]] const GapPolicy& policy() const noexcept { return policy_; }

private:
    GapPolicy policy_;
    Packet    current_;
    int64_t   last_mark_{0};

    [[nodiscard]] int64_t mark(const ObservedTx& tx) const noexcept;
};

// Convenience: group a finite, ordered list.
[[nodiscard]] std::vector<Packet> groupIntoPackets(std::vector<ObservedTx> txs, GapPolicy policy);

} // namespace enigmatic

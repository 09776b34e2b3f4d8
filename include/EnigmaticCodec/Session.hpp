#pragma once
// Session.hpp – Sending and watching symbols through external collaborators.
//
// Usage example (send):
//   SymbolSender sender{dialect, coins, heights, signer, broadcaster};
//   SendReport r = sender.send("HEARTBEAT", "dgb1qdest...");
//   if (!r.valid) sender.resume(r.frames, *r.failed_frame, r.txids.back());
//
// Usage example (watch):
//   Watcher w{dialect, observer, {{"dgb1qdest..."}}};
//   w.run(token, [] { std::this_thread::sleep_for(30s); },
//         [](const DecodedMessage& m) { ... });

#include "Collaborators.hpp"
#include "Decoder.hpp"
#include "Encoder.hpp"
#include "PacketGrouper.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace enigmatic {

// ─────────────────────────────────────────────────────────────────────────────
//  SymbolSender
// ─────────────────────────────────────────────────────────────────────────────

struct SendReport {
    std::vector<Frame>       frames;  // every frame of the symbol, kept for resume
    std::vector<std::string> txids;   // one per frame broadcast by this call
    bool                     valid{true};
    std::optional<size_t>    failed_frame;
    std::string              error;
};

struct SenderOptions {
    uint32_t                 min_confirmations{1};
    std::optional<uint64_t>  seed;              // fixes the fee jitter
    const CancellationToken* cancel{nullptr};
    // Called after each frame is accepted; may block until it confirms.
    std::function<void(const Frame&, const std::string& txid)> on_submitted;
};

class SymbolSender {
public:
    SymbolSender(const Dialect& dialect,
                 CoinSource&    coins,
                 HeightSource&  heights,
                 Signer&        signer,
                 Broadcaster&   broadcaster,
                 SenderOptions  options = {});

    // Encode `symbol` against fresh coins and broadcast every frame in order.
    [[nodiscard]] SendReport send(const std::string& symbol, const std::string& address);

    // Broadcast frames[from..] of an earlier send; `last_txid` is the txid of
    // frames[from - 1] and replaces its previous-change reference.
    [[nodiscard]] SendReport resume(const std::vector<Frame>& frames,
                                    size_t from,
                                    const std::string& last_txid);

    // Replace previous-change inputs of `frame` with (prev_txid, change index).
    [[nodiscard]] static Frame resolveInputs(const Frame& frame, const std::string& prev_txid);

private:
    CoinSource&    coins_;
    HeightSource&  heights_;
    Signer&        signer_;
    Broadcaster&   broadcaster_;
    SenderOptions  options_;
    Encoder        encoder_;

    void broadcastFrom(SendReport& report, size_t from, std::string prev_txid);
};

// ─────────────────────────────────────────────────────────────────────────────
//  Watcher
// ─────────────────────────────────────────────────────────────────────────────

struct WatcherOptions {
    std::set<std::string>    addresses;
    size_t                   idle_flush_polls{3};  // empty polls before the open packet closes
    std::optional<GapPolicy> gap;                  // defaults to the dialect's policy
    int64_t                  start_cursor{0};
    // Txids are remembered for this many heights below the newest observation;
    // anything older than that window is dropped as already handled.
    int64_t                  dedup_depth{1000};
};

class Watcher {
public:
    Watcher(const Dialect& dialect, TransactionObserver& observer, WatcherOptions options);

    // One poll step. Returns the number of messages handed to `sink`.
    size_t pollOnce(const MessageSink& sink);

    // Decode the open packet now, if any.
    size_t flush(const MessageSink& sink);

    // Poll until `token` is cancelled, calling `wait` between polls. The open
    // packet is flushed on exit. Returns the number of messages emitted.
    size_t run(const CancellationToken& token, const std::function<void()>& wait, const MessageSink& sink);

    [[nodiscard]] int64_t cursor()        const noexcept { return cursor_; }
    [[nodiscard]] size_t  failures()      const noexcept { return failures_; }
    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }
    [[nodiscard]] size_t  seenCount()     const noexcept { return seen_.size(); }
    [[nodiscard]] bool    hasOpenPacket() const noexcept { return grouper_.hasOpenPacket(); }

private:
    void forgetBelow(int64_t height);

    TransactionObserver&  observer_;
    WatcherOptions        options_;
    Decoder               decoder_;
    PacketGrouper         grouper_;
    int64_t               cursor_;
    std::set<std::string> seen_;
    std::map<int64_t, std::vector<std::string>> seen_at_;   // height -> txids in seen_
    std::optional<int64_t> newest_height_;
    size_t                idle_polls_{0};
    size_t                failures_{0};
    std::string           last_error_;
};

} // namespace enigmatic

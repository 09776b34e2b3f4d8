// Session.cpp – SymbolSender and Watcher.

#include "EnigmaticCodec/Session.hpp"

#include <algorithm>
#include <exception>

namespace enigmatic {

// ─────────────────────────────────────────────────────────────────────────────
//  SymbolSender
// ─────────────────────────────────────────────────────────────────────────────

SymbolSender::SymbolSender(const Dialect& dialect,
                           CoinSource&    coins,
                           HeightSource&  heights,
                           Signer&        signer,
                           Broadcaster&   broadcaster,
                           SenderOptions  options)
    : coins_(coins),
      heights_(heights),
      signer_(signer),
      broadcaster_(broadcaster),
      options_(std::move(options)),
      encoder_(options_.seed ? Encoder{dialect, *options_.seed} : Encoder{dialect}) {}

Frame SymbolSender::resolveInputs(const Frame& frame, const std::string& prev_txid) {
    Frame out = frame;
    for (auto& in : out.plan.inputs)
        if (in.ref.isPreviousChange()) in.ref.txid = prev_txid;
    return out;
}

SendReport SymbolSender::send(const std::string& symbol, const std::string& address) {
    SendReport report;

    std::vector<Coin> coins;
    int64_t height = 0;
    try {
        coins  = coins_.listSpendable(options_.min_confirmations);
        height = heights_.currentHeight();
    } catch (const std::exception& e) {
        report.valid = false;
        report.error = std::string("Wallet query failed: ") + e.what();
        return report;
    }

    EncodeResult enc = encoder_.encode(symbol, address, coins, height);
    if (!enc.valid) {
        report.valid        = false;
        report.failed_frame = enc.failed_frame;
        report.error        = enc.error;
        return report;
    }

    report.frames = std::move(enc.frames);
    broadcastFrom(report, 0, {});
    return report;
}

SendReport SymbolSender::resume(const std::vector<Frame>& frames, size_t from, const std::string& last_txid) {
    SendReport report;
    report.frames = frames;
    if (from >= frames.size()) {
        report.valid = false;
        report.error = "Resume index " + std::to_string(from) + " out of range (" +
                       std::to_string(frames.size()) + " frames)";
        return report;
    }
    broadcastFrom(report, from, last_txid);
    return report;
}

void SymbolSender::broadcastFrom(SendReport& report, size_t from, std::string prev_txid) {
    for (size_t i = from; i < report.frames.size(); ++i) {
        const std::string where = "Frame #" + std::to_string(i + 1) + " of " + report.frames[i].symbol;

        if (options_.cancel && options_.cancel->cancelled()) {
            report.valid        = false;
            report.failed_frame = i;
            report.error        = where + ": cancelled";
            return;
        }

        const Frame& planned = report.frames[i];
        const bool needs_prev =
            std::any_of(planned.plan.inputs.begin(), planned.plan.inputs.end(),
                        [](const Coin& c) { return c.ref.isPreviousChange(); });
        if (needs_prev && prev_txid.empty()) {
            report.valid        = false;
            report.failed_frame = i;
            report.error        = where + ": spends the previous frame's change but no txid is known";
            return;
        }

        const Frame ready = needs_prev ? resolveInputs(planned, prev_txid) : planned;
        std::string txid;
        try {
            txid = broadcaster_.submit(signer_.sign(ready));
        } catch (const std::exception& e) {
            report.valid        = false;
            report.failed_frame = i;
            report.error        = where + ": " + e.what();
            return;
        }

        report.txids.push_back(txid);
        if (options_.on_submitted) options_.on_submitted(ready, txid);
        prev_txid = std::move(txid);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Watcher
// ─────────────────────────────────────────────────────────────────────────────

Watcher::Watcher(const Dialect& dialect, TransactionObserver& observer, WatcherOptions options)
    : observer_(observer),
      options_(std::move(options)),
      decoder_(dialect),
      grouper_(options_.gap.value_or(dialect.packet_gap)),
      cursor_(options_.start_cursor) {}

void Watcher::forgetBelow(int64_t height) {
    auto end = seen_at_.lower_bound(height);
    for (auto it = seen_at_.begin(); it != end; ++it)
        for (const auto& txid : it->second) seen_.erase(txid);
    seen_at_.erase(seen_at_.begin(), end);
}

size_t Watcher::flush(const MessageSink& sink) {
    if (auto open = grouper_.flush()) {
        sink(decoder_.decode(*open));
        return 1;
    }
    return 0;
}

size_t Watcher::pollOnce(const MessageSink& sink) {
    ObservationBatch batch;
    try {
        batch = observer_.observationsSince(options_.addresses, cursor_);
    } catch (const std::exception& e) {
        ++failures_;
        last_error_ = e.what();
        return 0;
    }
    cursor_ = batch.cursor;

    std::vector<ObservedTx> fresh;
    for (auto& tx : batch.txs) {
        if (newest_height_ && tx.height < *newest_height_ - options_.dedup_depth)
            continue;
        if (!seen_.insert(tx.txid).second)
            continue;
        seen_at_[tx.height].push_back(tx.txid);
        fresh.push_back(std::move(tx));
    }
    for (const auto& tx : fresh)
        if (!newest_height_ || tx.height > *newest_height_) newest_height_ = tx.height;
    if (newest_height_)
        forgetBelow(*newest_height_ - options_.dedup_depth);

    if (fresh.empty()) {
        ++idle_polls_;
        if (idle_polls_ >= options_.idle_flush_polls) {
            idle_polls_ = 0;
            return flush(sink);
        }
        return 0;
    }
    idle_polls_ = 0;

    std::stable_sort(fresh.begin(), fresh.end(), [](const ObservedTx& a, const ObservedTx& b) {
        if (a.height != b.height) return a.height < b.height;
        return a.timestamp < b.timestamp;
    });

    size_t emitted = 0;
    for (auto& tx : fresh) {
        if (auto closed = grouper_.push(std::move(tx))) {
            sink(decoder_.decode(*closed));
            ++emitted;
        }
    }
    return emitted;
}

size_t Watcher::run(const CancellationToken& token, const std::function<void()>& wait, const MessageSink& sink) {
    size_t emitted = 0;
    while (!token.cancelled()) {
        emitted += pollOnce(sink);
        if (token.cancelled()) break;
        if (wait) wait();
    }
    return emitted + flush(sink);
}

} // namespace enigmatic

// Decoder.cpp – Single-frame matching and chain reassembly.
//
// Per transaction, in (height, timestamp) order:
//   1. Offer it to every open chain matcher. A matcher advances when the
//      transaction satisfies its next frame (cadence measured from the
//      matcher's previous frame) and, for linked chains, spends the previous
//      frame's designated change. A transaction that fits every plane except
//      cadence abandons the matcher.
//   2. A transaction consumed by a matcher is not matched again. If it could
//      also start a symbol, the overlap is reported as Ambiguous and the
//      chain is not emitted (ordered dialects keep the open chain).
//   3. Otherwise its state vector is matched against every symbol's entry
//      frame: single-frame symbols decode immediately, chains open a matcher.
//      A single that shares its entry with a chain is emitted unless that
//      chain completes.

#include "EnigmaticCodec/Decoder.hpp"

#include <algorithm>
#include <map>

namespace enigmatic {

const char* decodeStatusName(DecodeStatus s) {
    switch (s) {
    case DecodeStatus::Decoded:      return "decoded";
    case DecodeStatus::Ambiguous:    return "ambiguous";
    case DecodeStatus::NoMatch:      return "no-match";
    case DecodeStatus::PartialChain: return "partial-chain";
    }
    return "unknown";
}

std::vector<std::string> DecodedMessage::symbolNames() const {
    std::vector<std::string> names;
    names.reserve(symbols.size());
    for (const auto& s : symbols) names.push_back(s.name);
    return names;
}

namespace {

struct ChainMatcher {
    const SymbolDef*        sym{nullptr};
    size_t                  next{1};
    std::vector<size_t>     tx_pos;
    int64_t                 last_height{0};
    std::optional<OutPoint> change;
    bool                    contested{false}; // a consumed frame could also start a symbol
};

struct Found {
    size_t        pos{0};      // position of the first frame in the packet
    DecodedSymbol sym;
    bool          dropped{false};
};

size_t declarationIndex(const Dialect& d, const SymbolDef* sym) {
    return static_cast<size_t>(sym - d.symbols.data());
}

bool spends(const ObservedTx& tx, const OutPoint& op) {
    return std::find(tx.inputs.begin(), tx.inputs.end(), op) != tx.inputs.end();
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  Packet decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedMessage Decoder::decode(const Packet& packet) const {
    DecodedMessage msg;

    std::vector<ObservedTx> txs = packet.txs;
    std::stable_sort(txs.begin(), txs.end(), [](const ObservedTx& a, const ObservedTx& b) {
        if (a.height != b.height) return a.height < b.height;
        return a.timestamp < b.timestamp;
    });
    msg.tx_count = txs.size();

    const bool ordered = dialect_.resolution == Resolution::Ordered;

    std::vector<ChainMatcher>       active;
    std::vector<Found>              found;
    std::map<size_t, size_t>        single_at; // tx position -> index into found

    auto txidsOf = [&](const std::vector<size_t>& positions) {
        std::vector<std::string> ids;
        for (size_t p : positions) ids.push_back(txs[p].txid);
        return ids;
    };

    auto partialOf = [&](const ChainMatcher& m, std::string reason) {
        PartialChainReport rep;
        rep.symbol          = m.sym->name;
        rep.frames_matched  = m.tx_pos.size();
        rep.frames_expected = m.sym->frames.size();
        rep.txids           = txidsOf(m.tx_pos);
        rep.reason          = std::move(reason);
        return rep;
    };

    auto changeOf = [&](const ObservedTx& tx) -> std::optional<OutPoint> {
        if (auto idx = projector_.designatedChange(tx))
            return OutPoint{tx.txid, static_cast<uint32_t>(*idx)};
        return std::nullopt;
    };

    for (size_t pos = 0; pos < txs.size(); ++pos) {
        const ObservedTx& tx = txs[pos];

        // Entry candidates. Ordered dialects take the first single-frame
        // symbol and, when declared before it, the first chain.
        const std::optional<int64_t> prior =
            pos > 0 ? std::optional<int64_t>{txs[pos - 1].height} : std::nullopt;
        const StateVector sv = projector_.project(tx, prior);

        std::vector<const SymbolDef*> singles;
        std::vector<const SymbolDef*> chains;
        for (const auto& sym : dialect_.symbols) {
            if (!sym.frames.front().satisfiedBy(sv)) continue;
            if (!sym.isChain()) {
                singles.push_back(&sym);
                if (ordered) break;
            } else if (!ordered || chains.empty()) {
                chains.push_back(&sym);
            }
        }
        const bool entry_hit = !singles.empty() || !chains.empty();

        // ── Step 1: advance open chain matchers ─────────────────────────────
        bool consumed = false;
        std::vector<std::string>  advanced;
        std::vector<ChainMatcher> still_open;
        std::vector<ChainMatcher> completed;
        for (auto& m : active) {
            const FramePredicate& pred = m.sym->frames[m.next];
            const StateVector csv      = projector_.project(tx, m.last_height);
            const bool linked_ok       = !m.sym->linked || (m.change && spends(tx, *m.change));

            if (!linked_ok || !pred.satisfiedBy(csv, false)) {
                still_open.push_back(std::move(m));
                continue;
            }
            if (!pred.satisfiedBy(csv, true)) {
                msg.partials.push_back(partialOf(
                    m, "frame #" + std::to_string(m.next + 1) + " block delta " +
                       std::to_string(*csv.block_delta) + " outside cadence"));
                continue;
            }

            consumed = true;
            advanced.push_back(m.sym->name);
            if (!ordered && entry_hit)
                m.contested = true;
            m.tx_pos.push_back(pos);
            m.last_height = tx.height;
            m.change      = changeOf(tx);
            ++m.next;
            if (m.next == m.sym->frames.size())
                completed.push_back(std::move(m));
            else
                still_open.push_back(std::move(m));
        }
        active = std::move(still_open);

        // The transaction continues a chain and could also start a symbol.
        if (consumed && !ordered && entry_hit) {
            AmbiguityReport amb;
            auto add = [&](const std::string& name) {
                if (std::find(amb.candidates.begin(), amb.candidates.end(), name) == amb.candidates.end())
                    amb.candidates.push_back(name);
            };
            for (const auto& name : advanced) add(name);
            for (const auto* s : singles) add(s->name);
            for (const auto* c : chains) add(c->name);
            amb.txids.push_back(tx.txid);
            msg.ambiguities.push_back(std::move(amb));
        }

        // ── Step 2: settle completed chains ─────────────────────────────────
        if (ordered && completed.size() > 1) {
            auto first = std::min_element(completed.begin(), completed.end(),
                                          [&](const ChainMatcher& a, const ChainMatcher& b) {
                                              return declarationIndex(dialect_, a.sym) <
                                                     declarationIndex(dialect_, b.sym);
                                          });
            ChainMatcher keep = std::move(*first);
            completed.clear();
            completed.push_back(std::move(keep));
        }

        if (completed.size() > 1) {
            AmbiguityReport amb;
            for (const auto& m : completed) {
                amb.candidates.push_back(m.sym->name);
                for (const auto& id : txidsOf(m.tx_pos))
                    if (std::find(amb.txids.begin(), amb.txids.end(), id) == amb.txids.end())
                        amb.txids.push_back(id);
            }
            msg.ambiguities.push_back(std::move(amb));
        } else if (completed.size() == 1) {
            const ChainMatcher& m = completed.front();
            const size_t first    = m.tx_pos.front();

            Found f;
            f.pos               = first;
            f.sym.name          = m.sym->name;
            f.sym.txids         = txidsOf(m.tx_pos);
            f.sym.first_height  = txs[first].height;
            f.sym.chain         = true;
            f.dropped           = m.contested;

            // The entry frame also decoded as a single-frame symbol. Ordered
            // dialects only open a chain beside a later-declared single.
            auto clash = single_at.find(first);
            if (clash != single_at.end() && !found[clash->second].dropped) {
                Found& single = found[clash->second];
                single.dropped = true;
                if (!ordered) {
                    f.dropped = true;
                    msg.ambiguities.push_back({{single.sym.name, f.sym.name}, f.sym.txids});
                }
            }
            found.push_back(std::move(f));
        }

        if (consumed)
            continue;

        // ── Step 3: entry-frame matching ────────────────────────────────────
        if (!entry_hit) {
            ++msg.unmatched;
            continue;
        }

        if (singles.size() > 1) {
            AmbiguityReport amb;
            for (const auto* s : singles) amb.candidates.push_back(s->name);
            amb.txids.push_back(tx.txid);
            msg.ambiguities.push_back(std::move(amb));
        } else if (singles.size() == 1) {
            Found f;
            f.pos              = pos;
            f.sym.name         = singles.front()->name;
            f.sym.txids        = {tx.txid};
            f.sym.first_height = tx.height;
            single_at[pos]     = found.size();
            found.push_back(std::move(f));
        }

        for (const auto* c : chains) {
            ChainMatcher m;
            m.sym         = c;
            m.tx_pos      = {pos};
            m.last_height = tx.height;
            m.change      = changeOf(tx);
            active.push_back(std::move(m));
        }
    }

    for (const auto& m : active) {
        msg.partials.push_back(partialOf(
            m, "packet ended after " + std::to_string(m.tx_pos.size()) + " of " +
               std::to_string(m.sym->frames.size()) + " frames"));
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Found& a, const Found& b) { return a.pos < b.pos; });
    for (auto& f : found)
        if (!f.dropped) msg.symbols.push_back(std::move(f.sym));

    if (!msg.ambiguities.empty())
        msg.status = DecodeStatus::Ambiguous;
    else if (!msg.symbols.empty())
        msg.status = DecodeStatus::Decoded;
    else if (!msg.partials.empty())
        msg.status = DecodeStatus::PartialChain;
    else
        msg.status = DecodeStatus::NoMatch;

    return msg;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Stream decode
// ─────────────────────────────────────────────────────────────────────────────

size_t Decoder::decodeStream(ObservationSource& source, GapPolicy policy, const MessageSink& sink) const {
    PacketGrouper grouper{policy};
    size_t packets = 0;

    while (auto tx = source.next()) {
        if (auto closed = grouper.push(std::move(*tx))) {
            sink(decode(*closed));
            ++packets;
        }
    }
    if (auto last = grouper.flush()) {
        sink(decode(*last));
        ++packets;
    }
    return packets;
}

} // namespace enigmatic

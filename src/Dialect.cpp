// Dialect.cpp – Predicate evaluation, symbol matching and overlap analysis.

#include "EnigmaticCodec/Dialect.hpp"

#include <algorithm>
#include <cstdlib>

namespace enigmatic {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

bool hasPrefix(const std::vector<uint8_t>& data, const std::vector<uint8_t>& prefix) {
    return data.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), data.begin());
}

template <class Rule>
const Rule* findRule(const std::vector<PlaneRule>& rules) {
    for (const auto& r : rules)
        if (const auto* p = std::get_if<Rule>(&r))
            return p;
    return nullptr;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  FramePredicate
// ─────────────────────────────────────────────────────────────────────────────

bool FramePredicate::satisfiedBy(const StateVector& sv, bool check_cadence) const {
    for (const auto& rule : rules) {
        const bool ok = std::visit(Overloaded{
            [&](const ValueRule& r) { return sv.value == r.header.amount; },
            [&](const FeeRule& r) {
                return sv.fee >= r.band.low() && sv.fee <= r.band.high();
            },
            [&](const CardinalityRule& r) {
                if (sv.in_count != r.def.m || sv.out_count != r.def.n) return false;
                return !r.def.symmetry || *r.def.symmetry == sv.symmetry;
            },
            [&](const BlockRule& r) {
                if (!check_cadence || !sv.block_delta) return true;
                return std::llabs(*sv.block_delta - r.cadence.delta) <= r.cadence.jitter;
            },
            [&](const AuxRule& r) {
                const bool has_aux = sv.aux.has_value() && !sv.aux->empty();
                if (!r.present) return !has_aux;
                return has_aux && hasPrefix(*sv.aux, r.prefix);
            },
        }, rule);
        if (!ok) return false;
    }
    return true;
}

const ValueRule*       FramePredicate::valueRule()       const { return findRule<ValueRule>(rules); }
const FeeRule*         FramePredicate::feeRule()         const { return findRule<FeeRule>(rules); }
const CardinalityRule* FramePredicate::cardinalityRule() const { return findRule<CardinalityRule>(rules); }
const BlockRule*       FramePredicate::blockRule()       const { return findRule<BlockRule>(rules); }
const AuxRule*         FramePredicate::auxRule()         const { return findRule<AuxRule>(rules); }

bool predicatesDisjoint(const FramePredicate& a, const FramePredicate& b) {
    // A plane separates the two predicates only if both constrain it.
    if (auto* va = a.valueRule(); va)
        if (auto* vb = b.valueRule(); vb && va->header.amount != vb->header.amount)
            return true;

    if (auto* fa = a.feeRule(); fa)
        if (auto* fb = b.feeRule(); fb &&
            (fa->band.high() < fb->band.low() || fb->band.high() < fa->band.low()))
            return true;

    if (auto* ca = a.cardinalityRule(); ca) {
        if (auto* cb = b.cardinalityRule(); cb) {
            if (ca->def.m != cb->def.m || ca->def.n != cb->def.n)
                return true;
            if (ca->def.symmetry && cb->def.symmetry && *ca->def.symmetry != *cb->def.symmetry)
                return true;
        }
    }

    if (auto* xa = a.auxRule(); xa) {
        if (auto* xb = b.auxRule(); xb) {
            if (xa->present != xb->present)
                return true;
            if (xa->present && !hasPrefix(xa->prefix, xb->prefix) && !hasPrefix(xb->prefix, xa->prefix))
                return true;
        }
    }

    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Dialect
// ─────────────────────────────────────────────────────────────────────────────

const SymbolDef* Dialect::findSymbol(const std::string& symbol_name) const {
    auto it = std::find_if(symbols.begin(), symbols.end(),
                           [&](const SymbolDef& s) { return s.name == symbol_name; });
    return it == symbols.end() ? nullptr : &*it;
}

MatchResult Dialect::match(const StateVector& sv) const {
    MatchResult result;
    for (const auto& sym : symbols) {
        if (sym.frames.empty() || !sym.frames.front().satisfiedBy(sv))
            continue;
        result.candidates.push_back(sym.name);
        if (!result.symbol)
            result.symbol = &sym;
        if (resolution == Resolution::Ordered)
            break;
    }

    if (result.candidates.empty()) {
        result.status = MatchStatus::NoMatch;
    } else if (result.candidates.size() == 1) {
        result.status = MatchStatus::Matched;
    } else {
        result.status = MatchStatus::Ambiguous;
        result.symbol = nullptr;
    }
    return result;
}

std::vector<SymbolConflict> Dialect::findConflicts() const {
    std::vector<SymbolConflict> out;
    auto record = [&](const std::string& a, const std::string& b) {
        const bool known = std::any_of(out.begin(), out.end(), [&](const SymbolConflict& c) {
            return (c.first == a && c.second == b) || (c.first == b && c.second == a);
        });
        if (!known)
            out.push_back({a, b});
    };

    for (size_t i = 0; i < symbols.size(); ++i) {
        for (size_t j = i + 1; j < symbols.size(); ++j) {
            const SymbolDef& a = symbols[i];
            const SymbolDef& b = symbols[j];
            if (a.frames.empty() || b.frames.empty())
                continue;

            // Two chains collide only if every frame they share overlaps;
            // a single-frame symbol collides with a chain on its entry frame.
            const size_t depth = (a.isChain() && b.isChain())
                ? std::min(a.frames.size(), b.frames.size())
                : 1;
            bool overlap = true;
            for (size_t k = 0; k < depth && overlap; ++k)
                overlap = !predicatesDisjoint(a.frames[k], b.frames[k]);

            if (overlap)
                record(a.name, b.name);
        }
    }

    // A transaction advancing an open chain past its entry frame must not
    // also be able to start any symbol, the chain itself included.
    for (const auto& chain : symbols) {
        for (size_t k = 1; k < chain.frames.size(); ++k) {
            for (const auto& other : symbols) {
                if (!other.frames.empty() && !predicatesDisjoint(chain.frames[k], other.frames.front()))
                    record(chain.name, other.name);
            }
        }
    }
    return out;
}

} // namespace enigmatic

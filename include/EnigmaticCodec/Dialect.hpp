#pragma once
// Dialect.hpp – Plane declarations, symbol predicates and the symbol table.
// A Dialect is built by DialectLoader and is read-only afterwards; it may be
// shared across concurrent encode / decode sessions.

#include "Types.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace enigmatic {

// ─── Plane declarations ───────────────────────────────────────────────────────
enum class ValueRole { Anchor, Micro };

struct ValueHeader {
    std::string name;
    Amount      amount{0};
    ValueRole   role{ValueRole::Anchor};
};

struct FeeBand {
    std::string name;
    Amount      center{0};
    Amount      tolerance{0};

    [[nodiscard]] Amount low()  const { return center - tolerance; }
    [[nodiscard]] Amount high() const { return center + tolerance; }
};

struct CardinalityDef {
    std::string             name;
    uint32_t                m{1};   // inputs
    uint32_t                n{1};   // outputs
    std::optional<Symmetry> symmetry;
};

struct Cadence {
    std::string name;
    int64_t     delta{0};
    int64_t     jitter{1};
};

// Secondary sort key applied when two outputs carry the same amount.
enum class ChangePlacement { TargetFirst, ChangeFirst };

enum class OutputOrder { Canonical, Reversed };

// ─── Predicate rules (one closed variant per plane) ───────────────────────────
struct ValueRule       { ValueHeader header; };
struct FeeRule         { FeeBand band; };
struct CardinalityRule { CardinalityDef def; };
struct BlockRule       { Cadence cadence; };
struct AuxRule {
    bool                 present{true};
    std::vector<uint8_t> prefix; // only meaningful when present
};

using PlaneRule = std::variant<ValueRule, FeeRule, CardinalityRule, BlockRule, AuxRule>;

// Conjunction of plane rules describing one frame.
struct FramePredicate {
    std::vector<PlaneRule> rules;
    OutputOrder            order{OutputOrder::Canonical};

    // check_cadence=false evaluates every plane except the block interval.
    [[nodiscard]] bool satisfiedBy(const StateVector& sv, bool check_cadence = true) const;

    [[nodiscard]] const ValueRule*       valueRule()       const;
    [[nodiscard]] const FeeRule*         feeRule()         const;
    [[nodiscard]] const CardinalityRule* cardinalityRule() const;
    [[nodiscard]] const BlockRule*       blockRule()       const;
    [[nodiscard]] const AuxRule*         auxRule()         const;
};

// True when no state vector can satisfy both predicates. Cadence never makes
// predicates disjoint: the first frame of a stream satisfies every cadence.
[[nodiscard]] bool predicatesDisjoint(const FramePredicate& a, const FramePredicate& b);

// ─── Symbols ──────────────────────────────────────────────────────────────────
struct SymbolDef {
    std::string                 name;
    std::string                 description;
    std::vector<FramePredicate> frames;      // one entry for single-frame symbols
    bool                        linked{false};
    std::vector<uint8_t>        payload;     // aux payload attached by the encoder

    [[nodiscard]] bool isChain() const { return frames.size() > 1; }
};

// How overlapping predicates are treated.
enum class Resolution {
    Strict,  // overlap is a load-time error
    Ordered, // declaration order wins
    Flagged, // overlap is recorded and surfaces as Ambiguous
};

struct SymbolConflict {
    std::string first;
    std::string second;
};

enum class MatchStatus { Matched, Ambiguous, NoMatch };

struct MatchResult {
    MatchStatus              status{MatchStatus::NoMatch};
    const SymbolDef*         symbol{nullptr};  // set when Matched
    std::vector<std::string> candidates;       // every satisfied symbol, declaration order
};

// ─── Full dialect ─────────────────────────────────────────────────────────────
struct Dialect {
    std::string name;
    std::string version;
    Resolution  resolution{Resolution::Strict};

    Amount dust_floor{kDefaultDustFloor};
    Amount min_fee{0};
    uint32_t        asymmetry_threshold{1};
    ChangePlacement placement{ChangePlacement::TargetFirst};
    GapPolicy       packet_gap;

    std::map<std::string, ValueHeader>    headers;
    std::map<std::string, FeeBand>        bands;
    std::map<std::string, CardinalityDef> cardinalities;
    std::map<std::string, Cadence>        cadences;

    std::vector<SymbolDef>      symbols;     // declaration order
    std::vector<SymbolConflict> conflicts;   // filled for Resolution::Flagged

    // Lookup by name; nullptr if absent.
    [[nodiscard]] const SymbolDef* findSymbol(const std::string& name) const;

    // Match a state vector against the first frame of every symbol.
    // Ordered dialects return the first satisfied symbol; otherwise more than
    // one satisfied symbol is reported as Ambiguous.
    [[nodiscard]] MatchResult match(const StateVector& sv) const;

    // Every pair of symbols that can claim the same transaction: overlapping
    // entry predicates, or a chain frame past the entry that overlaps another
    // symbol's entry predicate.
    [[nodiscard]] std::vector<SymbolConflict> findConflicts() const;
};

} // namespace enigmatic

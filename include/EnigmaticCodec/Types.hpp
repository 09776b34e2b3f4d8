#pragma once
// Types.hpp – Core ledger-facing and state-vector types for the Enigmatic codec.
// Every amount in the engine is an integer count of minor units.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace enigmatic {

// ─── Amounts ──────────────────────────────────────────────────────────────────
using Amount = int64_t;

inline constexpr Amount kMinorUnitsPerCoin = 100'000'000;
inline constexpr Amount kDefaultDustFloor  = 10'000;   // 0.0001 coin

// Placeholder txid for an input that spends the previous frame's change output.
// The vout of such a reference is the change index inside the previous frame.
inline constexpr const char* kPreviousChangeTxid = "<previous-change>";

// ─── Ledger references ────────────────────────────────────────────────────────
struct OutPoint {
    std::string txid;
    uint32_t    vout{0};

    bool operator==(const OutPoint&) const = default;

    [[nodiscard]] bool isPreviousChange() const { return txid == kPreviousChangeTxid; }
};

// One spendable output, as supplied by the external coin source.
struct Coin {
    OutPoint ref;
    Amount   amount{0};
    uint32_t confirmations{0};
};

// One output of an observed transaction.
struct TxOutput {
    Amount      amount{0};
    std::string script_ref; // address or script identifier; opaque to the core
};

// A transaction as seen by the external transaction observer.
struct ObservedTx {
    std::string           txid;
    int64_t               height{0};
    int64_t               timestamp{0}; // seconds since epoch
    std::vector<OutPoint> inputs;
    std::vector<TxOutput> outputs;
    Amount                fee{0};
    std::vector<uint8_t>  aux;          // auxiliary payload (null-data output), empty if none
};

// ─── State vector ─────────────────────────────────────────────────────────────
enum class Symmetry { Mirrored, Neutral, Asymmetric };

struct StateVector {
    Amount                              value{0};
    Amount                              fee{0};
    uint32_t                            in_count{0};
    uint32_t                            out_count{0};
    std::optional<int64_t>              block_delta; // nullopt for the first frame of a stream
    Symmetry                            symmetry{Symmetry::Neutral};
    std::optional<std::vector<uint8_t>> aux;

    bool operator==(const StateVector&) const = default;
};

// ─── Packets ──────────────────────────────────────────────────────────────────
enum class GapUnit { Height, Seconds };

struct GapPolicy {
    GapUnit unit{GapUnit::Height};
    int64_t threshold{12};
};

struct Packet {
    std::vector<ObservedTx> txs;
};

// ─── Amount text helpers (Amount.cpp) ─────────────────────────────────────────

// Parse "7", "7.00", "0.00022659" into minor units without floating point.
// Returns nullopt for malformed input or more than 8 fractional digits.
std::optional<Amount> parseAmount(const std::string& text);

// Render minor units as a fixed 8-decimal coin string, e.g. "7.00000000".
std::string formatAmount(Amount amount);

const char* symmetryName(Symmetry s);

} // namespace enigmatic

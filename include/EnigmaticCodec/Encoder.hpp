#pragma once
// Encoder.hpp – Symbol -> one unsigned transaction skeleton per frame.
//
// Usage example:
//   Encoder enc{dialect};
//   EncodeResult r = enc.encode("HEARTBEAT", "dgb1qdest...", coins, height);
//   if (r.valid) for (const Frame& f : r.frames) signer.sign(f);
//
// Fees are drawn uniformly from each frame's fee band (clamped to the
// dialect's min_fee) so repeated symbols do not produce identical
// transactions. Seed the encoder explicitly for reproducible output.

#include "Dialect.hpp"
#include "Planner.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace enigmatic {

// One planned transaction realizing part of a symbol.
struct Frame {
    std::string            symbol;
    size_t                 index{0};
    size_t                 count{1};      // frames in the symbol
    Plan                   plan;
    std::optional<int64_t> target_height; // block-placement hint
    std::vector<uint8_t>   aux;           // auxiliary payload, empty if none
};

enum class EncodeError { None, UnknownSymbol, PlanningFailed };

struct EncodeResult {
    std::vector<Frame>    frames;
    bool                  valid{true};
    EncodeError           error_code{EncodeError::None};
    PlanError             plan_error{PlanError::None};   // set for PlanningFailed
    std::optional<size_t> failed_frame;
    std::string           error;
};

class Encoder {
public:
    explicit Encoder(const Dialect& dialect);
    Encoder(const Dialect& dialect, uint64_t seed);

    // Encode `symbol` to frames paying `address`, funded from `coins`.
    // start_height anchors the block-placement hints; without it frames carry
    // no target height.
    [[nodiscard]] EncodeResult encode(const std::string& symbol,
                                      const std::string& address,
                                      const std::vector<Coin>& coins,
                                      std::optional<int64_t> start_height = std::nullopt);

    // Draw a fee from `band`, never below the dialect's min_fee.
    [[nodiscard]] Amount drawFee(const FeeBand& band);

    // Translate one frame predicate into planner input (fee already drawn).
    [[nodiscard]] FrameSpec frameSpec(const FramePredicate& pred,
                                      Amount fee,
                                      const std::string& address,
                                      bool link_previous) const;

private:
    const Dialect&  dialect_;
    std::mt19937_64 rng_;
};

} // namespace enigmatic

#pragma once
// Planner.hpp – UTXO selection and change layout for one frame or a chain.
//
// The planner is pure with respect to its coin list: it never reserves or
// locks coins and keeps no state between calls. Callers that plan concurrently
// against the same wallet must serialize or re-query coins themselves.

#include "Dialect.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace enigmatic {

enum class OutputRole { Target, Change };

struct PlannedOutput {
    Amount      amount{0};
    OutputRole  role{OutputRole::Target};
    std::string address; // empty for change; the signer assigns change addresses
};

struct Plan {
    std::vector<Coin>          inputs;
    std::vector<PlannedOutput> outputs;
    Amount                     fee{0};
    std::optional<size_t>      change_index; // designated change output, if any

    [[nodiscard]] Amount inputTotal()  const;
    [[nodiscard]] Amount outputTotal() const;
};

enum class PlanError {
    None,
    InsufficientFunds,
    DustViolation,
    BrokenLinkage,   // a linked frame has no change output to spend
    InvalidRequest,
};

const char* planErrorName(PlanError e);

struct PlanResult {
    Plan        plan;
    bool        valid{true};
    PlanError   error_code{PlanError::None};
    std::string error;
};

struct PlanRequest {
    std::vector<Amount>     target_outputs;          // ordered target amounts
    Amount                  fee{0};
    uint32_t                target_out_count{0};     // 0 = no explicit cardinality
    std::optional<uint32_t> input_count;             // exact input count, if required
    Amount                  dust_floor{kDefaultDustFloor};
    Amount                  reserve{0};              // extra funds selection must cover
    std::vector<Coin>       mandatory_inputs;        // always spent, counted first
    OutputOrder             order{OutputOrder::Canonical};
    ChangePlacement         placement{ChangePlacement::TargetFirst};
    std::string             target_address;
};

// Plan a single frame.
//   1. Take mandatory inputs, then coins sorted by amount descending: the top
//      input_count coins if an exact count is requested, otherwise first-fit
//      until the total covers targets + fee + reserve.
//   2. change = selected - targets - fee.
//   3. change == 0 omits change outputs entirely; otherwise change is split as
//      evenly as possible over (target_out_count - targets) branches, or one
//      branch when no extra cardinality is requested. Any branch under the
//      dust floor fails the plan.
//   4. Outputs are sorted by amount (ascending, or descending when reversed),
//      ties broken by placement.
[[nodiscard]] PlanResult plan(const std::vector<Coin>& coins, const PlanRequest& request);

struct FrameSpec {
    PlanRequest request;
    bool        link_previous{true}; // spend the previous frame's designated change
};

struct ChainPlanResult {
    std::vector<Plan>     plans;
    bool                  valid{true};
    PlanError             error_code{PlanError::None};
    std::optional<size_t> failed_frame;
    std::string           error;
};

// Plan frames in order. A linked frame receives the previous frame's change
// as a virtual coin (txid kPreviousChangeTxid, vout = change index) plus any
// coins not yet spent by earlier frames. Linked frames carry the total need of
// the frames after them as reserve. Failure aborts the whole chain.
[[nodiscard]] ChainPlanResult planChain(const std::vector<Coin>& coins,
                                        const std::vector<FrameSpec>& frames);

// Realize an ordered list of amounts as a linked chain of single-target frames
// sharing one fee.
[[nodiscard]] ChainPlanResult planPattern(const std::vector<Coin>& coins,
                                          const std::vector<Amount>& amounts,
                                          Amount fee,
                                          Amount dust_floor = kDefaultDustFloor,
                                          const std::string& target_address = {});

} // namespace enigmatic

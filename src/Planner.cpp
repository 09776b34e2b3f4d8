// Planner.cpp – Coin selection, change splitting and chain planning.
//
// Conservation invariant for every valid Plan:
//   sum(inputs) == sum(outputs) + fee        (exact, integer minor units)

#include "EnigmaticCodec/Planner.hpp"

#include <algorithm>
#include <numeric>

namespace enigmatic {

Amount Plan::inputTotal() const {
    return std::accumulate(inputs.begin(), inputs.end(), Amount{0},
                           [](Amount acc, const Coin& c) { return acc + c.amount; });
}

Amount Plan::outputTotal() const {
    return std::accumulate(outputs.begin(), outputs.end(), Amount{0},
                           [](Amount acc, const PlannedOutput& o) { return acc + o.amount; });
}

const char* planErrorName(PlanError e) {
    switch (e) {
    case PlanError::None:              return "none";
    case PlanError::InsufficientFunds: return "insufficient-funds";
    case PlanError::DustViolation:     return "dust-violation";
    case PlanError::BrokenLinkage:     return "broken-linkage";
    case PlanError::InvalidRequest:    return "invalid-request";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
//  Single frame
// ─────────────────────────────────────────────────────────────────────────────

static PlanResult planFailure(PlanError code, std::string msg) {
    PlanResult r;
    r.valid      = false;
    r.error_code = code;
    r.error      = std::move(msg);
    return r;
}

// Sort outputs by amount, then by role according to the placement rule.
static void orderOutputs(std::vector<PlannedOutput>& outs, OutputOrder order, ChangePlacement placement) {
    const OutputRole first = placement == ChangePlacement::TargetFirst ? OutputRole::Target
                                                                       : OutputRole::Change;
    std::stable_sort(outs.begin(), outs.end(), [&](const PlannedOutput& a, const PlannedOutput& b) {
        if (a.amount != b.amount)
            return order == OutputOrder::Canonical ? a.amount < b.amount : a.amount > b.amount;
        return a.role == first && b.role != first;
    });
}

PlanResult plan(const std::vector<Coin>& coins, const PlanRequest& req) {
    // ── Request sanity ───────────────────────────────────────────────────────
    if (req.target_outputs.empty())
        return planFailure(PlanError::InvalidRequest, "At least one target output is required");
    if (req.fee < 0)
        return planFailure(PlanError::InvalidRequest, "Fee must be non-negative");
    if (req.reserve < 0)
        return planFailure(PlanError::InvalidRequest, "Reserve must be non-negative");
    if (req.input_count && *req.input_count == 0)
        return planFailure(PlanError::InvalidRequest, "Exact input count must be at least 1");
    if (req.input_count && req.mandatory_inputs.size() > *req.input_count)
        return planFailure(PlanError::InvalidRequest,
                           "Mandatory inputs exceed the requested input count " +
                           std::to_string(*req.input_count));
    if (req.target_out_count != 0 && req.target_out_count < req.target_outputs.size())
        return planFailure(PlanError::InvalidRequest,
                           "Target output count " + std::to_string(req.target_out_count) +
                           " is smaller than the number of target amounts");

    Amount targets = 0;
    for (Amount a : req.target_outputs) {
        if (a <= 0)
            return planFailure(PlanError::InvalidRequest, "Each target output must be positive");
        if (a < req.dust_floor)
            return planFailure(PlanError::DustViolation,
                               "Target output " + formatAmount(a) + " is below the dust floor " +
                               formatAmount(req.dust_floor));
        targets += a;
    }
    const Amount need = targets + req.fee + req.reserve;

    // ── Step 1: coin selection ───────────────────────────────────────────────
    Plan p;
    p.fee    = req.fee;
    p.inputs = req.mandatory_inputs;
    Amount selected = p.inputTotal();

    std::vector<Coin> pool;
    for (const auto& c : coins) {
        if (c.amount <= 0) continue;
        const bool mandatory = std::any_of(req.mandatory_inputs.begin(), req.mandatory_inputs.end(),
                                           [&](const Coin& m) { return m.ref == c.ref; });
        if (!mandatory) pool.push_back(c);
    }
    std::stable_sort(pool.begin(), pool.end(),
                     [](const Coin& a, const Coin& b) { return a.amount > b.amount; });

    if (req.input_count) {
        const size_t wanted = *req.input_count - p.inputs.size();
        if (pool.size() < wanted)
            return planFailure(PlanError::InsufficientFunds,
                               "Requires " + std::to_string(*req.input_count) + " inputs but only " +
                               std::to_string(pool.size() + p.inputs.size()) + " coins are spendable");
        for (size_t i = 0; i < wanted; ++i) {
            p.inputs.push_back(pool[i]);
            selected += pool[i].amount;
        }
    } else {
        for (const auto& c : pool) {
            if (selected >= need && !p.inputs.empty()) break;
            p.inputs.push_back(c);
            selected += c.amount;
        }
    }

    if (selected < need)
        return planFailure(PlanError::InsufficientFunds,
                           "Selected inputs total " + formatAmount(selected) + " but need " +
                           formatAmount(need));

    // ── Step 2: outputs and change ───────────────────────────────────────────
    for (Amount a : req.target_outputs)
        p.outputs.push_back({a, OutputRole::Target, req.target_address});

    const Amount change = selected - targets - req.fee;
    if (change > 0) {
        const size_t branches = req.target_out_count > req.target_outputs.size()
            ? req.target_out_count - req.target_outputs.size()
            : 1;
        const Amount base = change / static_cast<Amount>(branches);
        const Amount rem  = change % static_cast<Amount>(branches);
        for (size_t i = 0; i < branches; ++i) {
            const Amount amt = base + (static_cast<Amount>(i) < rem ? 1 : 0);
            if (amt < req.dust_floor)
                return planFailure(PlanError::DustViolation,
                                   "Change " + formatAmount(change) + " split over " +
                                   std::to_string(branches) + " branches leaves " + formatAmount(amt) +
                                   ", below the dust floor " + formatAmount(req.dust_floor));
            p.outputs.push_back({amt, OutputRole::Change, {}});
        }
    }

    // ── Step 3: ordering and designated change ───────────────────────────────
    orderOutputs(p.outputs, req.order, req.placement);

    for (size_t i = 0; i < p.outputs.size(); ++i) {
        if (p.outputs[i].role != OutputRole::Change) continue;
        if (!p.change_index || p.outputs[i].amount >= p.outputs[*p.change_index].amount)
            p.change_index = i;
    }

    PlanResult r;
    r.plan = std::move(p);
    return r;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Chains
// ─────────────────────────────────────────────────────────────────────────────

static Amount frameNeed(const PlanRequest& req) {
    return std::accumulate(req.target_outputs.begin(), req.target_outputs.end(), Amount{0}) + req.fee;
}

ChainPlanResult planChain(const std::vector<Coin>& coins, const std::vector<FrameSpec>& frames) {
    ChainPlanResult out;
    if (frames.empty()) {
        out.valid      = false;
        out.error_code = PlanError::InvalidRequest;
        out.error      = "Chain has no frames";
        return out;
    }

    auto fail = [&](size_t idx, PlanError code, const std::string& msg) {
        out.plans.clear();
        out.valid        = false;
        out.error_code   = code;
        out.failed_frame = idx;
        out.error        = "Frame #" + std::to_string(idx + 1) + ": " + msg;
        return out;
    };

    std::vector<Coin> available = coins;

    for (size_t i = 0; i < frames.size(); ++i) {
        PlanRequest req   = frames[i].request;
        const bool linked = i > 0 && frames[i].link_previous;

        if (linked) {
            const Plan& prev = out.plans.back();
            if (!prev.change_index)
                return fail(i, PlanError::BrokenLinkage, "previous frame produced no change output to spend");
            Coin virtual_coin;
            virtual_coin.ref    = OutPoint{kPreviousChangeTxid, static_cast<uint32_t>(*prev.change_index)};
            virtual_coin.amount = prev.outputs[*prev.change_index].amount;
            req.mandatory_inputs.insert(req.mandatory_inputs.begin(), virtual_coin);
        }

        // Change of a frame funds the contiguous run of linked frames after it.
        for (size_t j = i + 1; j < frames.size() && frames[j].link_previous; ++j)
            req.reserve += frameNeed(frames[j].request);

        PlanResult r = plan(available, req);
        if (!r.valid)
            return fail(i, r.error_code, r.error);

        available.erase(std::remove_if(available.begin(), available.end(),
                                       [&](const Coin& c) {
                                           return std::any_of(r.plan.inputs.begin(), r.plan.inputs.end(),
                                                              [&](const Coin& used) { return used.ref == c.ref; });
                                       }),
                        available.end());
        out.plans.push_back(std::move(r.plan));
    }
    return out;
}

ChainPlanResult planPattern(const std::vector<Coin>& coins,
                            const std::vector<Amount>& amounts,
                            Amount fee,
                            Amount dust_floor,
                            const std::string& target_address) {
    if (amounts.empty()) {
        ChainPlanResult out;
        out.valid      = false;
        out.error_code = PlanError::InvalidRequest;
        out.error      = "At least one output amount must be provided";
        return out;
    }

    std::vector<FrameSpec> frames;
    for (Amount a : amounts) {
        FrameSpec f;
        f.request.target_outputs = {a};
        f.request.fee            = fee;
        f.request.dust_floor     = dust_floor;
        f.request.target_address = target_address;
        frames.push_back(std::move(f));
    }
    return planChain(coins, frames);
}

} // namespace enigmatic

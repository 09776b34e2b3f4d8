// test_planner.cpp – Coin selection, change layout and chain planning.

#include "EnigmaticCodec/Planner.hpp"

#include "TestSupport.hpp"

#include <iostream>
#include <string>

using namespace enigmatic;
using namespace enigmatic::testing;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static bool conserves(const Plan& p) {
    return p.inputTotal() == p.outputTotal() + p.fee;
}

static void printPlan(const Plan& p) {
    std::cout << "     inputs:";
    for (const auto& c : p.inputs) std::cout << ' ' << c.ref.txid << ':' << c.ref.vout << '=' << formatAmount(c.amount);
    std::cout << "\n     outputs:";
    for (const auto& o : p.outputs)
        std::cout << ' ' << (o.role == OutputRole::Target ? 'T' : 'C') << '=' << formatAmount(o.amount);
    std::cout << "  fee=" << formatAmount(p.fee) << '\n';
}

static PlanRequest request(Amount target, Amount fee) {
    PlanRequest r;
    r.target_outputs = {target};
    r.fee            = fee;
    r.target_address = "dest";
    return r;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: greedy selection with a single change output
// ─────────────────────────────────────────────────────────────────────────────
static void testGreedy() {
    std::cout << "\n=== Test: Greedy selection ===\n";
    const std::vector<Coin> coins = {makeCoin("c1", 0, kCoin), makeCoin("c5", 0, 5 * kCoin),
                                     makeCoin("c3", 0, 3 * kCoin)};
    PlanResult r = plan(coins, request(2 * kCoin, 10'000'000));
    CHECK(r.valid, "plan valid");
    printPlan(r.plan);
    CHECK(r.plan.inputs.size() == 1 && r.plan.inputs[0].ref.txid == "c5", "largest coin first, one input");
    CHECK(r.plan.outputs.size() == 2,                                      "target + one change");
    CHECK(r.plan.outputs[0].role == OutputRole::Target && r.plan.outputs[0].amount == 2 * kCoin,
          "target first (smaller)");
    CHECK(r.plan.outputs[0].address == "dest",                             "target carries address");
    CHECK(r.plan.outputs[1].amount == 290'000'000,                         "change = 5 - 2 - 0.1");
    CHECK(r.plan.change_index == 1u,                                       "change index 1");
    CHECK(conserves(r.plan),                                               "inputs == outputs + fee");

    r = plan(coins, request(7 * kCoin, 10'000'000));
    CHECK(r.valid && r.plan.inputs.size() == 2,                            "7.1 needs two coins (5 + 3)");
    CHECK(conserves(r.plan),                                               "conservation with two inputs");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: exact input count and change branches
// ─────────────────────────────────────────────────────────────────────────────
static void testExactCardinality() {
    std::cout << "\n=== Test: Exact cardinality ===\n";
    const auto coins = makeCoins("ten", 3, 10 * kCoin);

    PlanRequest req      = request(7 * kCoin, 21'000'000);
    req.input_count      = 3;
    req.target_out_count = 3;
    PlanResult r = plan(coins, req);
    CHECK(r.valid, "3-in / 3-out plan valid");
    printPlan(r.plan);
    CHECK(r.plan.inputs.size() == 3,                                "exactly 3 inputs");
    CHECK(r.plan.outputs.size() == 3,                               "exactly 3 outputs");
    CHECK(r.plan.outputs[1].amount == 1'139'500'000 &&
          r.plan.outputs[2].amount == 1'139'500'000,                "change split evenly");
    CHECK(r.plan.change_index == 2u,                                "equal change -> highest index");
    CHECK(conserves(r.plan),                                        "conservation");

    req.fee = 21'000'001;
    r = plan(coins, req);
    CHECK(r.valid, "odd change still plans");
    CHECK(r.plan.outputs[1].amount == 1'139'499'999 &&
          r.plan.outputs[2].amount == 1'139'500'000,                "remainder goes to one branch");
    CHECK(conserves(r.plan),                                        "conservation with remainder");

    req.input_count = 4;
    r = plan(coins, req);
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds, "4 inputs from 3 coins fails");

    PlanRequest top   = request(10 * kCoin, 50'000'000);
    top.input_count   = 1;
    const std::vector<Coin> uneven = {makeCoin("big", 0, 10 * kCoin), makeCoin("s1", 0, kCoin),
                                      makeCoin("s2", 0, kCoin)};
    r = plan(uneven, top);
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds,
          "top-1 coin short even though the wallet total covers the need");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: funds, dust and zero change
// ─────────────────────────────────────────────────────────────────────────────
static void testFailures() {
    std::cout << "\n=== Test: Funds and dust ===\n";
    PlanResult r = plan({makeCoin("c", 0, kCoin)}, request(2 * kCoin, 0));
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds, "insufficient funds");
    std::cout << "     (" << r.error << ")\n";

    r = plan({}, request(kCoin, 0));
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds, "no coins -> insufficient funds");

    r = plan({makeCoin("c", 0, kCoin)}, request(5'000, 0));
    CHECK(!r.valid && r.error_code == PlanError::DustViolation, "sub-dust target rejected");

    r = plan({makeCoin("c", 0, 2 * kCoin + 5'000)}, request(2 * kCoin, 0));
    CHECK(!r.valid && r.error_code == PlanError::DustViolation, "sub-dust change rejected");
    std::cout << "     (" << r.error << ")\n";

    r = plan({makeCoin("c", 0, 2 * kCoin + 10'000)}, request(2 * kCoin, 0));
    CHECK(r.valid && r.plan.outputs.size() == 2, "change exactly at dust floor accepted");

    r = plan({makeCoin("c", 0, 2 * kCoin + 10'000'000)}, request(2 * kCoin, 10'000'000));
    CHECK(r.valid, "exact funding plans");
    CHECK(r.plan.outputs.size() == 1 && !r.plan.change_index, "zero change -> no change output");
    CHECK(conserves(r.plan), "conservation without change");

    PlanRequest bad = request(kCoin, -1);
    CHECK(plan({makeCoin("c", 0, 5 * kCoin)}, bad).error_code == PlanError::InvalidRequest, "negative fee rejected");
    bad = request(kCoin, 0);
    bad.target_outputs.clear();
    CHECK(plan({makeCoin("c", 0, 5 * kCoin)}, bad).error_code == PlanError::InvalidRequest, "no targets rejected");
    bad = request(kCoin, 0);
    bad.target_outputs   = {kCoin, kCoin};
    bad.target_out_count = 1;
    CHECK(plan({makeCoin("c", 0, 5 * kCoin)}, bad).error_code == PlanError::InvalidRequest,
          "cardinality smaller than targets rejected");
    CHECK(std::string(planErrorName(PlanError::DustViolation)) == "dust-violation", "error names");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: output ordering
// ─────────────────────────────────────────────────────────────────────────────
static void testOrdering() {
    std::cout << "\n=== Test: Output ordering ===\n";
    const std::vector<Coin> coins = {makeCoin("c", 0, 10 * kCoin + 10'000'000)};

    PlanRequest req = request(5 * kCoin, 10'000'000);   // change == target == 5
    PlanResult r = plan(coins, req);
    CHECK(r.valid && r.plan.outputs[0].role == OutputRole::Target, "equal amounts: target first by default");
    CHECK(r.plan.change_index == 1u, "change index follows placement");

    req.placement = ChangePlacement::ChangeFirst;
    r = plan(coins, req);
    CHECK(r.valid && r.plan.outputs[0].role == OutputRole::Change, "equal amounts: change first when asked");
    CHECK(r.plan.change_index == 0u, "change index 0");

    req           = request(2 * kCoin, 10'000'000);
    req.order     = OutputOrder::Reversed;
    r = plan(coins, req);
    CHECK(r.valid && r.plan.outputs[0].amount > r.plan.outputs[1].amount, "reversed order is descending");
    CHECK(r.plan.change_index == 0u, "change designated after reordering");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: chains and patterns
// ─────────────────────────────────────────────────────────────────────────────
static void testPattern() {
    std::cout << "\n=== Test: Pattern chain ===\n";
    const std::vector<Coin> coins = {makeCoin("w", 0, 20 * kCoin)};
    ChainPlanResult r = planPattern(coins, {kCoin, 2 * kCoin, 3 * kCoin}, 10'000'000);
    CHECK(r.valid && r.plans.size() == 3, "3-frame pattern plans");
    for (const auto& p : r.plans) printPlan(p);

    bool all_conserve = true;
    for (const auto& p : r.plans) all_conserve = all_conserve && conserves(p);
    CHECK(all_conserve, "every frame conserves value");

    if (r.plans.size() == 3) {
        const Plan& first  = r.plans[0];
        const Plan& second = r.plans[1];
        CHECK(first.inputs.size() == 1 && first.inputs[0].ref.txid == "w", "first frame funded by wallet coin");
        CHECK(first.outputs[*first.change_index].amount == 1'890'000'000,  "first change carries the rest");
        CHECK(second.inputs.size() == 1 && second.inputs[0].ref.isPreviousChange(),
              "second frame spends previous change only");
        CHECK(second.inputs[0].ref.vout == *first.change_index,           "virtual input points at change index");
        CHECK(second.inputs[0].amount == first.outputs[*first.change_index].amount, "virtual input amount");
        CHECK(r.plans[2].outputs[*r.plans[2].change_index].amount == 1'370'000'000, "final change 13.7");
    }

    r = planPattern(coins, {}, 0);
    CHECK(!r.valid && r.error_code == PlanError::InvalidRequest, "empty pattern rejected");

    r = planPattern({makeCoin("w", 0, 3 * kCoin)}, {kCoin, 5 * kCoin}, 0);
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds, "reserve fails the chain up front");
    CHECK(r.failed_frame == 0u && r.plans.empty(),                    "failure reported on frame #1");
    CHECK(r.error.rfind("Frame #1", 0) == 0,                           "error names the frame");
}

static void testUnlinkedChain() {
    std::cout << "\n=== Test: Unlinked chain ===\n";
    const auto coins = makeCoins("u", 2, 5 * kCoin);

    FrameSpec a;
    a.request             = request(kCoin, 10'000'000);
    a.request.input_count = 1;
    FrameSpec b           = a;
    b.link_previous       = false;

    ChainPlanResult r = planChain(coins, {a, b});
    CHECK(r.valid && r.plans.size() == 2, "two independent frames plan");
    if (r.plans.size() == 2) {
        CHECK(!r.plans[1].inputs[0].ref.isPreviousChange(),                        "no virtual input");
        CHECK(r.plans[0].inputs[0].ref.txid != r.plans[1].inputs[0].ref.txid,     "coins are not reused");
    }

    r = planChain(coins, {a, b, b});
    CHECK(!r.valid && r.error_code == PlanError::InsufficientFunds && r.failed_frame == 2u,
          "third frame runs out of coins");

    r = planChain(coins, {});
    CHECK(!r.valid && r.error_code == PlanError::InvalidRequest, "empty chain rejected");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testGreedy();
    testExactCardinality();
    testFailures();
    testOrdering();
    testPattern();
    testUnlinkedChain();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

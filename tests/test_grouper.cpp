// test_grouper.cpp – Gap-based packet grouping over finite and live feeds.

#include "EnigmaticCodec/PacketGrouper.hpp"

#include <iostream>
#include <string>

using namespace enigmatic;

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

static ObservedTx at(int64_t height, int64_t timestamp = 0) {
    ObservedTx tx;
    tx.txid      = "h" + std::to_string(height) + "t" + std::to_string(timestamp);
    tx.height    = height;
    tx.timestamp = timestamp;
    return tx;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: height gap law
// ─────────────────────────────────────────────────────────────────────────────
static void testHeightGap() {
    std::cout << "\n=== Test: Height gap ===\n";
    const GapPolicy policy{GapUnit::Height, 12};

    auto packets = groupIntoPackets({at(100), at(112)}, policy);
    CHECK(packets.size() == 1 && packets[0].txs.size() == 2, "difference == gap stays in one packet");

    packets = groupIntoPackets({at(100), at(113)}, policy);
    CHECK(packets.size() == 2, "difference == gap + 1 splits");

    packets = groupIntoPackets({at(100), at(105), at(110), at(200), at(201), at(400)}, policy);
    CHECK(packets.size() == 3,              "three clusters -> three packets");
    CHECK(packets[0].txs.size() == 3 &&
          packets[1].txs.size() == 2 &&
          packets[2].txs.size() == 1,       "cluster sizes 3 / 2 / 1");
    CHECK(packets[1].txs[0].height == 200,  "second packet starts at 200");

    CHECK(groupIntoPackets({}, policy).empty(), "empty stream -> no packets");

    // Chained gaps: each step is within the gap even though the span is not.
    packets = groupIntoPackets({at(0), at(10), at(20), at(30)}, policy);
    CHECK(packets.size() == 1, "gap is measured between neighbours, not from packet start");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: timestamp gap
// ─────────────────────────────────────────────────────────────────────────────
static void testSecondsGap() {
    std::cout << "\n=== Test: Seconds gap ===\n";
    const GapPolicy policy{GapUnit::Seconds, 600};
    auto packets = groupIntoPackets({at(1, 1000), at(1, 1600), at(2, 2201)}, policy);
    CHECK(packets.size() == 2, "timestamps drive the split, heights ignored");
    CHECK(packets[0].txs.size() == 2, "first packet holds the two close observations");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: push-driven live feed
// ─────────────────────────────────────────────────────────────────────────────
static void testPushFeed() {
    std::cout << "\n=== Test: Push feed ===\n";
    PacketGrouper g{GapPolicy{GapUnit::Height, 12}};

    CHECK(!g.push(at(100)).has_value(), "first push closes nothing");
    CHECK(!g.push(at(104)).has_value(), "within gap closes nothing");
    CHECK(g.hasOpenPacket() && g.openSize() == 2, "two observations open");

    auto closed = g.push(at(130));
    CHECK(closed.has_value() && closed->txs.size() == 2, "out-of-gap push closes the open packet");
    CHECK(g.openSize() == 1, "new packet holds the late observation");

    auto rest = g.flush();
    CHECK(rest.has_value() && rest->txs.size() == 1, "flush emits the open packet");
    CHECK(!g.hasOpenPacket() && !g.flush().has_value(), "flush on empty grouper emits nothing");

    // Same grouper keeps working after a flush.
    CHECK(!g.push(at(500)).has_value(), "grouper restarts after flush");

    VectorSource src{{at(600), at(601)}};
    auto drained = g.drain(src);
    CHECK(drained.size() == 2, "drain closes the pushed packet then flushes the source packet");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testHeightGap();
    testSecondsGap();
    testPushFeed();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

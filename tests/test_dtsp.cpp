// test_dtsp.cpp – Fee-plane alphabet and text codec.

#include "EnigmaticCodec/Dtsp.hpp"

#include <iostream>
#include <set>
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

static bool throwsDtsp(void (*fn)()) {
    try {
        fn();
    } catch (const dtsp::DtspError& e) {
        std::cout << "     (" << e.what() << ")\n";
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: alphabet layout
// ─────────────────────────────────────────────────────────────────────────────
static void testAlphabet() {
    std::cout << "\n=== Test: Alphabet ===\n";
    CHECK(dtsp::alphabet().size() == 26 + 10 + 12 + 3, "51 entries");
    CHECK(dtsp::amountFor('A') == 22'659 && dtsp::amountFor('Z') == 22'684, "letters 22659..22684");
    CHECK(dtsp::amountFor('0') == 22'648 && dtsp::amountFor('9') == 22'657, "digits 22648..22657");
    CHECK(dtsp::amountFor(' ') == 22'688 && dtsp::amountFor('_') == 22'699, "specials 22688..22699");
    CHECK(dtsp::amountFor('q') == dtsp::amountFor('Q'),                      "lower case folds to upper");
    CHECK(!dtsp::amountFor('#'),                                              "'#' not in the alphabet");

    std::set<Amount> distinct;
    for (const auto& e : dtsp::alphabet()) distinct.insert(e.amount);
    CHECK(distinct.size() == dtsp::alphabet().size(), "every code is unique");

    const std::string table = dtsp::formatTable();
    CHECK(table.rfind("symbol | amount", 0) == 0,                   "table header");
    CHECK(table.find("START | 0.00022611") != std::string::npos,    "table lists START");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: text round trip and markers
// ─────────────────────────────────────────────────────────────────────────────
static void testText() {
    std::cout << "\n=== Test: Text codec ===\n";
    const auto fees = dtsp::encodeText("Hello World");
    CHECK(fees.size() == 13,                                      "START + 11 chars + END");
    CHECK(fees.front() == dtsp::kStart && fees.back() == dtsp::kEnd, "framed by START / END");
    CHECK(dtsp::decodeAmounts(fees) == "HELLO WORLD",             "round trip upper-cases");

    std::vector<Amount> body = {dtsp::kStart, dtsp::kAccept};
    for (Amount a : dtsp::encodeText("HI", false)) body.push_back(a);
    body.push_back(dtsp::kEnd);
    const std::string raw = dtsp::decodeAmounts(body, false);
    CHECK(raw == "startacceptHIend", "control codes kept as lower-case names");

    CHECK(dtsp::decodeAmounts({dtsp::kStart, 22'659, 1, dtsp::kEnd}) == "A?", "unknown amount -> '?'");
    CHECK(dtsp::decodeAmounts({dtsp::kStart, 22'660, dtsp::kEnd}, true, 0) == "B", "exact match at zero tolerance");

    const auto near = dtsp::closestSymbol(22'661, 0);
    CHECK(near.key == "C" && near.error == 0, "closest symbol exact");
    const auto off = dtsp::closestSymbol(30'000, 5);
    CHECK(!off.key && off.error > 5, "far value outside tolerance");
    CHECK(dtsp::closestSymbol(22'610, 1).key == "START", "tolerance accepts a near miss");

    CHECK(throwsDtsp([] { (void)dtsp::encodeText("50%"); }),              "unsupported character throws");
    CHECK(throwsDtsp([] { (void)dtsp::decodeAmounts({}); }),              "empty sequence throws when markers required");
    CHECK(throwsDtsp([] { (void)dtsp::decodeAmounts({22'659, 22'660}); }), "missing markers throw");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testAlphabet();
    testText();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

// Encoder.cpp – Reverse symbol lookup, fee jitter and frame assembly.

#include "EnigmaticCodec/Encoder.hpp"

#include <algorithm>

namespace enigmatic {

Encoder::Encoder(const Dialect& dialect)
    : dialect_(dialect), rng_(std::random_device{}()) {}

Encoder::Encoder(const Dialect& dialect, uint64_t seed)
    : dialect_(dialect), rng_(seed) {}

Amount Encoder::drawFee(const FeeBand& band) {
    const Amount lo = std::max(band.low(), dialect_.min_fee);
    const Amount hi = std::max(band.high(), lo);
    std::uniform_int_distribution<Amount> dist(lo, hi);
    return dist(rng_);
}

FrameSpec Encoder::frameSpec(const FramePredicate& pred,
                             Amount fee,
                             const std::string& address,
                             bool link_previous) const {
    FrameSpec spec;
    spec.link_previous = link_previous;

    PlanRequest& req   = spec.request;
    req.target_outputs = {pred.valueRule()->header.amount};
    req.fee            = fee;
    req.dust_floor     = dialect_.dust_floor;
    req.order          = pred.order;
    req.placement      = dialect_.placement;
    req.target_address = address;

    const CardinalityDef& card = pred.cardinalityRule()->def;
    req.input_count      = card.m;
    req.target_out_count = card.n;
    return spec;
}

EncodeResult Encoder::encode(const std::string& symbol,
                             const std::string& address,
                             const std::vector<Coin>& coins,
                             std::optional<int64_t> start_height) {
    EncodeResult out;

    const SymbolDef* sym = dialect_.findSymbol(symbol);
    if (!sym) {
        out.valid      = false;
        out.error_code = EncodeError::UnknownSymbol;
        out.error      = "Symbol " + symbol + " not found in dialect " + dialect_.name;
        return out;
    }

    // The loader guarantees value, fee and cardinality rules on every frame.
    std::vector<FrameSpec> specs;
    for (size_t i = 0; i < sym->frames.size(); ++i) {
        const FramePredicate& pred = sym->frames[i];
        const Amount fee = drawFee(pred.feeRule()->band);
        specs.push_back(frameSpec(pred, fee, address, i > 0 && sym->linked));
    }

    ChainPlanResult chain = planChain(coins, specs);
    if (!chain.valid) {
        out.valid        = false;
        out.error_code   = EncodeError::PlanningFailed;
        out.plan_error   = chain.error_code;
        out.failed_frame = chain.failed_frame;
        out.error        = "Symbol " + symbol + ": " + chain.error;
        return out;
    }

    std::optional<int64_t> running = start_height;
    for (size_t i = 0; i < chain.plans.size(); ++i) {
        const FramePredicate& pred = sym->frames[i];

        Frame f;
        f.symbol = sym->name;
        f.index  = i;
        f.count  = chain.plans.size();
        f.plan   = std::move(chain.plans[i]);

        if (running) {
            if (const BlockRule* block = pred.blockRule()) {
                *running       += block->cadence.delta;
                f.target_height = running;
            }
        }

        if (const AuxRule* aux = pred.auxRule(); aux && aux->present)
            f.aux = sym->payload;

        out.frames.push_back(std::move(f));
    }
    return out;
}

} // namespace enigmatic

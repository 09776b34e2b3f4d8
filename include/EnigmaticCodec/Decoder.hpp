#pragma once
// Decoder.hpp – Packet of observed transactions -> decoded symbol sequence.
//
// Usage example:
//   Decoder dec{dialect};
//   DecodedMessage msg = dec.decode(packet);
//   if (msg.status == DecodeStatus::Decoded)
//       for (const auto& s : msg.symbols) std::cout << s.name << '\n';
//
// NoMatch, Ambiguous and PartialChain are ordinary results, not errors: a
// stream decoder keeps going after a packet that yields any of them.

#include "Dialect.hpp"
#include "PacketGrouper.hpp"
#include "Projector.hpp"

#include <functional>
#include <string>
#include <vector>

namespace enigmatic {

enum class DecodeStatus { Decoded, Ambiguous, NoMatch, PartialChain };

const char* decodeStatusName(DecodeStatus s);

struct DecodedSymbol {
    std::string              name;
    std::vector<std::string> txids;        // one per frame, in frame order
    int64_t                  first_height{0};
    bool                     chain{false};
};

// Two or more symbols satisfied by the same transaction(s); never resolved.
struct AmbiguityReport {
    std::vector<std::string> candidates;
    std::vector<std::string> txids;
};

// A chain matcher that was abandoned or left open at the end of the packet.
struct PartialChainReport {
    std::string              symbol;
    size_t                   frames_matched{0};
    size_t                   frames_expected{0};
    std::vector<std::string> txids;
    std::string              reason;
};

struct DecodedMessage {
    DecodeStatus                    status{DecodeStatus::NoMatch};
    std::vector<DecodedSymbol>      symbols;   // in order of their first frame
    std::vector<AmbiguityReport>    ambiguities;
    std::vector<PartialChainReport> partials;
    size_t                          tx_count{0};
    size_t                          unmatched{0}; // transactions that matched nothing

    [[nodiscard]] std::vector<std::string> symbolNames() const;
};

using MessageSink = std::function<void(const DecodedMessage&)>;

class Decoder {
public:
    explicit Decoder(const Dialect& dialect) noexcept : dialect_(dialect), projector_(dialect) {}

    // Decode one packet. Transactions are processed in (height, timestamp)
    // order regardless of the order they arrive in.
    [[nodiscard]] DecodedMessage decode(const Packet& packet) const;

    // Group `source` with `policy` and decode every packet into `sink`.
    // Returns the number of packets decoded.
    size_t decodeStream(ObservationSource& source, GapPolicy policy, const MessageSink& sink) const;

    // Same, using the dialect's packet gap policy.
    size_t decodeStream(ObservationSource& source, const MessageSink& sink) const {
        return decodeStream(source, dialect_.packet_gap, sink);
    }

    [[nodiscard]] const Projector& projector() const noexcept { return projector_; }

private:
    const Dialect& dialect_;
    Projector      projector_;
};

} // namespace enigmatic

// DialectLoader.cpp – Parses the XML dialect document into a Dialect.
// Uses pugixml for the document; amounts are converted to minor units exactly.

#include "EnigmaticCodec/DialectLoader.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <set>
#include <string>

namespace enigmatic {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static int64_t parseI64(const char* s, const char* ctx) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || *ptr != '\0')
        throw DialectLoadError(std::string(ctx) + ": cannot parse integer '" + s + "'");
    return v;
}

static Amount parseAmountAttr(const char* s, const std::string& ctx) {
    auto v = parseAmount(s);
    if (!v)
        throw DialectLoadError(ctx + ": cannot parse amount '" + s + "'");
    return *v;
}

static std::vector<uint8_t> parseHex(const std::string& s, const std::string& ctx) {
    if (s.size() % 2 != 0)
        throw DialectLoadError(ctx + ": hex string '" + s + "' has odd length");
    std::vector<uint8_t> out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        uint8_t byte = 0;
        auto [ptr, ec] = std::from_chars(s.data() + i, s.data() + i + 2, byte, 16);
        if (ec != std::errc{} || ptr != s.data() + i + 2)
            throw DialectLoadError(ctx + ": invalid hex string '" + s + "'");
        out.push_back(byte);
    }
    return out;
}

static ValueRole parseRole(const char* s) {
    if (!s || *s == '\0' || strcmp(s, "anchor") == 0) return ValueRole::Anchor;
    if (strcmp(s, "micro") == 0)                       return ValueRole::Micro;
    throw DialectLoadError(std::string("Unknown value role: '") + s + "'");
}

static std::optional<Symmetry> parseSymmetry(const char* s) {
    if (!s || *s == '\0')              return std::nullopt;
    if (strcmp(s, "mirrored")   == 0)  return Symmetry::Mirrored;
    if (strcmp(s, "neutral")    == 0)  return Symmetry::Neutral;
    if (strcmp(s, "asymmetric") == 0)  return Symmetry::Asymmetric;
    throw DialectLoadError(std::string("Unknown symmetry: '") + s + "'");
}

static Resolution parseResolution(const char* s) {
    if (!s || *s == '\0' || strcmp(s, "strict") == 0) return Resolution::Strict;
    if (strcmp(s, "ordered") == 0)                     return Resolution::Ordered;
    if (strcmp(s, "flagged") == 0)                     return Resolution::Flagged;
    throw DialectLoadError(std::string("Unknown resolution: '") + s + "'");
}

static OutputOrder parseOrder(const char* s) {
    if (!s || *s == '\0' || strcmp(s, "canonical") == 0) return OutputOrder::Canonical;
    if (strcmp(s, "reversed") == 0)                       return OutputOrder::Reversed;
    throw DialectLoadError(std::string("Unknown output order: '") + s + "'");
}

static ChangePlacement parsePlacement(const char* s) {
    if (!s || *s == '\0' || strcmp(s, "target_first") == 0) return ChangePlacement::TargetFirst;
    if (strcmp(s, "change_first") == 0)                      return ChangePlacement::ChangeFirst;
    throw DialectLoadError(std::string("Unknown ordering: '") + s + "'");
}

static GapUnit parseGapUnit(const char* s) {
    if (!s || *s == '\0' || strcmp(s, "height") == 0) return GapUnit::Height;
    if (strcmp(s, "seconds") == 0)                     return GapUnit::Seconds;
    throw DialectLoadError(std::string("Unknown packet gap unit: '") + s + "'");
}

// Look up a named plane entry; a missing declaration is a load error.
template <class Def>
static const Def& requireDeclared(const std::map<std::string, Def>& table,
                                  const std::string& ref,
                                  const char* plane,
                                  const std::string& ctx) {
    auto it = table.find(ref);
    if (it == table.end())
        throw DialectLoadError(ctx + " references undeclared " + plane + " '" + ref + "'");
    return it->second;
}

template <class Def>
static void insertUnique(std::map<std::string, Def>& table, Def def, const char* what) {
    if (def.name.empty())
        throw DialectLoadError(std::string("<") + what + "> missing 'name'");
    if (table.count(def.name))
        throw DialectLoadError(std::string("Duplicate ") + what + " '" + def.name + "'");
    std::string key = def.name;
    table.emplace(std::move(key), std::move(def));
}

// ─── Parse the <Planes> block ─────────────────────────────────────────────────

static void parsePlanes(pugi::xml_node node, Dialect& d) {
    if (auto value = node.child("Value")) {
        if (auto a = value.attribute("dust_floor"); a)
            d.dust_floor = parseAmountAttr(a.as_string(), "Value.dust_floor");
        for (auto h : value.children("Header")) {
            ValueHeader vh;
            vh.name   = h.attribute("name").as_string("");
            vh.amount = parseAmountAttr(h.attribute("amount").as_string(""), "Header '" + vh.name + "' amount");
            vh.role   = parseRole(h.attribute("role").as_string("anchor"));
            insertUnique(d.headers, std::move(vh), "Header");
        }
    }

    if (auto fee = node.child("Fee")) {
        if (auto a = fee.attribute("min_fee"); a)
            d.min_fee = parseAmountAttr(a.as_string(), "Fee.min_fee");
        for (auto b : fee.children("Band")) {
            FeeBand band;
            band.name      = b.attribute("name").as_string("");
            band.center    = parseAmountAttr(b.attribute("center").as_string(""), "Band '" + band.name + "' center");
            band.tolerance = parseAmountAttr(b.attribute("tolerance").as_string("0"), "Band '" + band.name + "' tolerance");
            insertUnique(d.bands, std::move(band), "Band");
        }
    }

    if (auto card = node.child("Cardinality")) {
        int64_t threshold = parseI64(card.attribute("asymmetry_threshold").as_string("1"),
                                     "Cardinality.asymmetry_threshold");
        if (threshold < 0)
            throw DialectLoadError("Cardinality.asymmetry_threshold must be >= 0");
        d.asymmetry_threshold = static_cast<uint32_t>(threshold);
        d.placement           = parsePlacement(card.attribute("ordering").as_string("target_first"));

        for (auto r : card.children("Rule")) {
            CardinalityDef cd;
            cd.name = r.attribute("name").as_string("");
            int64_t m = parseI64(r.attribute("m").as_string("0"), "Rule.m");
            int64_t n = parseI64(r.attribute("n").as_string("0"), "Rule.n");
            if (m < 1 || n < 1)
                throw DialectLoadError("Cardinality rule '" + cd.name + "' requires m,n >= 1");
            cd.m        = static_cast<uint32_t>(m);
            cd.n        = static_cast<uint32_t>(n);
            cd.symmetry = parseSymmetry(r.attribute("symmetry").as_string(""));
            insertUnique(d.cardinalities, std::move(cd), "Rule");
        }
    }

    if (auto block = node.child("Block")) {
        for (auto c : block.children("Cadence")) {
            Cadence cad;
            cad.name   = c.attribute("name").as_string("");
            cad.delta  = parseI64(c.attribute("delta").as_string("0"), "Cadence.delta");
            cad.jitter = parseI64(c.attribute("jitter").as_string("1"), "Cadence.jitter");
            insertUnique(d.cadences, std::move(cad), "Cadence");
        }
    }
}

// ─── Parse one <Match> / <Frame> node into a FramePredicate ───────────────────

static FramePredicate parsePredicate(pugi::xml_node node, const Dialect& d, const std::string& ctx) {
    FramePredicate p;

    if (auto a = node.attribute("value"); a)
        p.rules.emplace_back(ValueRule{requireDeclared(d.headers, a.as_string(), "value header", ctx)});
    if (auto a = node.attribute("fee"); a)
        p.rules.emplace_back(FeeRule{requireDeclared(d.bands, a.as_string(), "fee band", ctx)});
    if (auto a = node.attribute("cardinality"); a)
        p.rules.emplace_back(CardinalityRule{requireDeclared(d.cardinalities, a.as_string(), "cardinality rule", ctx)});
    if (auto a = node.attribute("block"); a)
        p.rules.emplace_back(BlockRule{requireDeclared(d.cadences, a.as_string(), "cadence", ctx)});

    if (auto a = node.attribute("aux"); a) {
        AuxRule aux;
        if (strcmp(a.as_string(), "present") == 0)      aux.present = true;
        else if (strcmp(a.as_string(), "absent") == 0)  aux.present = false;
        else
            throw DialectLoadError(ctx + ": aux must be 'present' or 'absent'");
        if (auto pfx = node.attribute("aux_prefix"); pfx) {
            if (!aux.present)
                throw DialectLoadError(ctx + ": aux_prefix given with aux='absent'");
            aux.prefix = parseHex(pfx.as_string(), ctx + " aux_prefix");
        }
        p.rules.emplace_back(std::move(aux));
    } else if (node.attribute("aux_prefix")) {
        throw DialectLoadError(ctx + ": aux_prefix requires aux='present'");
    }

    p.order = parseOrder(node.attribute("order").as_string("canonical"));
    return p;
}

// ─── Parse one <Symbol> node ──────────────────────────────────────────────────

static SymbolDef parseSymbol(pugi::xml_node node, const Dialect& d) {
    SymbolDef sym;
    sym.name        = node.attribute("name").as_string("");
    sym.description = node.attribute("description").as_string("");
    if (sym.name.empty())
        throw DialectLoadError("<Symbol> missing 'name' attribute");

    if (auto a = node.attribute("payload"); a)
        sym.payload = parseHex(a.as_string(), "Symbol '" + sym.name + "' payload");

    auto match = node.child("Match");
    auto chain = node.child("Chain");
    if (match && chain)
        throw DialectLoadError("Symbol '" + sym.name + "' declares both <Match> and <Chain>");

    if (match) {
        sym.frames.push_back(parsePredicate(match, d, "Symbol '" + sym.name + "'"));
    } else if (chain) {
        sym.linked = chain.attribute("linked").as_bool(true);
        size_t idx = 0;
        for (auto f : chain.children("Frame")) {
            ++idx;
            sym.frames.push_back(parsePredicate(
                f, d, "Symbol '" + sym.name + "' frame #" + std::to_string(idx)));
        }
        if (sym.frames.size() < 2)
            throw DialectLoadError("Chain symbol '" + sym.name + "' needs at least two <Frame> entries");
    } else {
        throw DialectLoadError("Symbol '" + sym.name + "' has no <Match> or <Chain>");
    }
    return sym;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Validation
// ─────────────────────────────────────────────────────────────────────────────

static void validatePlanes(const Dialect& d) {
    if (d.dust_floor <= 0)
        throw DialectLoadError("Dialect '" + d.name + "': dust_floor must be positive");
    if (d.min_fee < 0)
        throw DialectLoadError("Dialect '" + d.name + "': min_fee must be >= 0");

    for (const auto& [name, h] : d.headers) {
        if (h.amount < d.dust_floor)
            throw DialectLoadError("Header '" + name + "' amount " + formatAmount(h.amount) +
                                   " is below the dust floor " + formatAmount(d.dust_floor));
    }

    for (const auto& [name, b] : d.bands) {
        if (b.tolerance < 0)
            throw DialectLoadError("Band '" + name + "' has negative tolerance");
        if (b.high() < d.min_fee)
            throw DialectLoadError("Band '" + name + "' lies entirely below min_fee " +
                                   formatAmount(d.min_fee));
    }

    for (const auto& [name, c] : d.cardinalities) {
        if (!c.symmetry) continue;
        const uint32_t spread = c.m > c.n ? c.m - c.n : c.n - c.m;
        switch (*c.symmetry) {
        case Symmetry::Mirrored:
            if (c.m != c.n)
                throw DialectLoadError("Rule '" + name + "': mirrored symmetry requires m == n");
            break;
        case Symmetry::Asymmetric:
            if (spread <= d.asymmetry_threshold)
                throw DialectLoadError("Rule '" + name + "': asymmetric symmetry requires |m - n| > " +
                                       std::to_string(d.asymmetry_threshold));
            break;
        case Symmetry::Neutral:
            if (spread > d.asymmetry_threshold)
                throw DialectLoadError("Rule '" + name + "': neutral symmetry requires |m - n| <= " +
                                       std::to_string(d.asymmetry_threshold));
            break;
        }
    }

    for (const auto& [name, c] : d.cadences) {
        if (c.delta < 0)
            throw DialectLoadError("Cadence '" + name + "' has negative delta");
        if (c.jitter < 0)
            throw DialectLoadError("Cadence '" + name + "' has negative jitter");
    }
}

static void validateSymbol(const SymbolDef& sym) {
    bool carries_aux = false;
    for (size_t i = 0; i < sym.frames.size(); ++i) {
        const FramePredicate& f = sym.frames[i];
        const std::string ctx = "Symbol '" + sym.name + "' frame #" + std::to_string(i + 1);

        // Every frame must be realizable by the encoder.
        if (!f.valueRule())
            throw DialectLoadError(ctx + " has no value rule");
        if (!f.feeRule())
            throw DialectLoadError(ctx + " has no fee rule");
        if (!f.cardinalityRule())
            throw DialectLoadError(ctx + " has no cardinality rule");

        if (const AuxRule* aux = f.auxRule(); aux && aux->present) {
            carries_aux = true;
            if (sym.payload.empty())
                throw DialectLoadError(ctx + " requires aux but the symbol has no payload");
            if (sym.payload.size() < aux->prefix.size() ||
                !std::equal(aux->prefix.begin(), aux->prefix.end(), sym.payload.begin()))
                throw DialectLoadError(ctx + ": payload does not start with aux_prefix");
        }
    }
    if (!sym.payload.empty() && !carries_aux)
        throw DialectLoadError("Symbol '" + sym.name + "' has a payload but no frame with aux='present'");
}

void validateDialect(Dialect& d) {
    validatePlanes(d);

    if (d.symbols.empty())
        throw DialectLoadError("Dialect '" + d.name + "' defines no symbols");

    std::set<std::string> seen;
    for (const auto& sym : d.symbols) {
        if (!seen.insert(sym.name).second)
            throw DialectLoadError("Duplicate symbol '" + sym.name + "'");
        validateSymbol(sym);
    }

    d.conflicts.clear();
    if (d.resolution == Resolution::Ordered)
        return;

    auto conflicts = d.findConflicts();
    if (conflicts.empty())
        return;

    if (d.resolution == Resolution::Strict) {
        const auto& c = conflicts.front();
        throw DialectLoadError("Dialect '" + d.name + "': symbols '" + c.first + "' and '" +
                               c.second + "' can match the same state vector (" +
                               std::to_string(conflicts.size()) +
                               " conflict(s)); declare resolution=\"ordered\" or \"flagged\"");
    }
    d.conflicts = std::move(conflicts);
}

// ─── Public entry points ──────────────────────────────────────────────────────

static Dialect parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("Dialect");
    if (!root)
        throw DialectLoadError("XML root element must be <Dialect>");

    Dialect d;
    d.name       = root.attribute("name").as_string("");
    d.version    = root.attribute("version").as_string("0.0.0");
    d.resolution = parseResolution(root.attribute("resolution").as_string("strict"));
    if (d.name.empty())
        throw DialectLoadError("<Dialect> is missing 'name'");

    if (auto planes = root.child("Planes"))
        parsePlanes(planes, d);
    else
        throw DialectLoadError("No <Planes> element found in dialect '" + d.name + "'");

    if (auto packets = root.child("Packets")) {
        d.packet_gap.unit      = parseGapUnit(packets.attribute("unit").as_string("height"));
        d.packet_gap.threshold = parseI64(packets.attribute("gap").as_string("12"), "Packets.gap");
        if (d.packet_gap.threshold < 0)
            throw DialectLoadError("Packets.gap must be >= 0");
    }

    for (auto sym_node : root.child("Symbols").children("Symbol"))
        d.symbols.push_back(parseSymbol(sym_node, d));

    validateDialect(d);
    return d;
}

Dialect loadDialect(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw DialectLoadError("Failed to parse XML '" + xml_path.string() +
                               "': " + result.description());
    return parseDocument(doc);
}

Dialect loadDialectFromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result)
        throw DialectLoadError(std::string("Failed to parse dialect XML: ") + result.description());
    return parseDocument(doc);
}

} // namespace enigmatic

#pragma once
// Projector.hpp – Observed transaction -> StateVector.
//
// Usage example:
//   Projector proj{dialect};
//   StateVector sv = proj.project(tx, prior_height);
//
// project() is pure: the same (tx, prior_height) always yields the same vector.
// Non-protocol traffic (zero-valued or sub-dust outputs, no outputs at all) is
// projected like anything else and simply fails to match a symbol.

#include "Dialect.hpp"
#include <optional>

namespace enigmatic {

class Projector {
public:
    explicit Projector(const Dialect& dialect) noexcept : dialect_(dialect) {}

    [[nodiscard]] StateVector project(const ObservedTx& tx,
                                      std::optional<int64_t> prior_height) const;

    // Index of the output carrying the value header chosen by project().
    [[nodiscard]] std::optional<size_t> headerIndex(const ObservedTx& tx) const;

    // Index of the designated change output: the largest non-header output,
    // ties resolved to the highest index. nullopt if there is none.
    [[nodiscard]] std::optional<size_t> designatedChange(const ObservedTx& tx) const;

    [[nodiscard]] Symmetry classifySymmetry(const ObservedTx& tx) const;

private:
    const Dialect& dialect_;
};

} // namespace enigmatic

#pragma once
// DialectLoader.hpp – Parses an XML dialect document into a validated Dialect.

#include "Dialect.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace enigmatic {

// Thrown when the XML is structurally invalid, references undeclared plane
// entries, or declares overlapping predicates without opting in.
class DialectLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads a dialect from the given XML file path.
// Throws DialectLoadError on any parse or validation failure.
Dialect loadDialect(const std::filesystem::path& xml_path);

// Same as loadDialect() for an in-memory document.
Dialect loadDialectFromString(const std::string& xml);

// Runs the load-time checks on an already-built dialect (used by the loader,
// exposed for dialects assembled in code). Fills dialect.conflicts for
// Resolution::Flagged. Throws DialectLoadError.
void validateDialect(Dialect& dialect);

} // namespace enigmatic

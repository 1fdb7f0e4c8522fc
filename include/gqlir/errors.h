#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/errors.h — Exceptions raised by the compiler pipeline
// ═══════════════════════════════════════════════════════════════════
//
//  GraphQLError      — bad input: parse errors, unknown types/fields,
//                      fragment cycles, malformed schema documents.
//  CompilationError  — failures while lowering to the legacy IR, e.g.
//                      a referenced fragment without a definition.
//
//  Both abort the whole compilation run; nothing is recovered
//  partially.
//
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace gqlir {

// 1-based position in a source text
struct SourceLocation {
    std::size_t line = 1;
    std::size_t column = 1;

    bool operator==(const SourceLocation&) const = default;
};

class GraphQLError : public std::runtime_error {
public:
    explicit GraphQLError(const std::string& message,
                          std::optional<SourceLocation> location = std::nullopt)
        : std::runtime_error(format(message, location)),
          message_(message), location_(location) {}

    const std::string& message() const { return message_; }
    const std::optional<SourceLocation>& location() const { return location_; }

private:
    std::string message_;
    std::optional<SourceLocation> location_;

    static std::string format(const std::string& message,
                              const std::optional<SourceLocation>& location) {
        if (!location) return message;
        return message + " (line " + std::to_string(location->line) +
               ", column " + std::to_string(location->column) + ")";
    }
};

class CompilationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace gqlir

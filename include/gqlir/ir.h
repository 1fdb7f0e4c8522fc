#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/ir.h — Typed intermediate representation of a document
// ═══════════════════════════════════════════════════════════════════
//
//  Every selection set knows the concrete object types it can be
//  evaluated against. A selection is one of four kinds:
//
//    Field             — a schema field, optionally with a nested set
//    TypeCondition     — `... on T { }`, narrowed possible types
//    BooleanCondition  — selection guarded by @include/@skip($var)
//    FragmentSpread    — `...Name`, carrying the fragment's selections
//                        narrowed to the spreading set's possible types
//
//  Nested selection sets are immutable and shared through
//  SelectionSetPtr once built.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "options.h"
#include "ordered_map.h"
#include "schema.h"
#include "type_ref.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gqlir::ir {

struct SelectionSet;
using SelectionSetPtr = std::shared_ptr<const SelectionSet>;

struct Argument {
    std::string name;
    nlohmann::json value;
    std::optional<TypeRef> type;

    bool operator==(const Argument&) const = default;
};

struct Variable {
    std::string name;
    TypeRef type;

    bool operator==(const Variable&) const = default;
};

struct Field {
    std::string responseKey;
    std::string name;
    std::optional<std::string> alias;
    std::vector<Argument> args;
    TypeRef type;
    std::optional<std::string> description;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;
    // Set when the field is only selected under @include/@skip
    bool isConditional = false;
    SelectionSetPtr selectionSet;
};

struct TypeCondition {
    std::string type;
    SelectionSetPtr selectionSet;
};

struct BooleanCondition {
    std::string variableName;
    bool inverted = false;   // @skip
    SelectionSetPtr selectionSet;
};

struct FragmentSpread {
    std::string fragmentName;
    std::string typeCondition;
    SelectionSetPtr selectionSet;
};

using Selection = std::variant<Field, TypeCondition, BooleanCondition, FragmentSpread>;

struct SelectionSet {
    std::vector<std::string> possibleTypes;
    std::vector<Selection> selections;
};

// ── Visitor helper for std::visit over Selection ──
template <typename... Fs>
struct Overload : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
Overload(Fs...) -> Overload<Fs...>;

// Selection set owned by whichever kind of selection `selection` is;
// nullptr for leaf fields.
const SelectionSet* nestedSelectionSet(const Selection& selection);

// ── Possible-type set helpers (order follows `types`) ──
inline std::vector<std::string> intersectTypes(const std::vector<std::string>& types,
                                               const std::vector<std::string>& allowed) {
    std::vector<std::string> result;
    for (auto& type : types) {
        if (std::find(allowed.begin(), allowed.end(), type) != allowed.end()) result.push_back(type);
    }
    return result;
}

inline bool coversAll(const std::vector<std::string>& types, const std::vector<std::string>& subset) {
    return std::all_of(subset.begin(), subset.end(), [&types](const std::string& type) {
        return std::find(types.begin(), types.end(), type) != types.end();
    });
}

struct Operation {
    std::optional<std::string> filePath;
    std::string operationName;
    OperationType operationType = OperationType::Query;
    std::string rootType;
    std::vector<Variable> variables;
    std::string source;
    SelectionSetPtr selectionSet;
};

struct Fragment {
    std::optional<std::string> filePath;
    std::string fragmentName;
    std::string source;
    std::string typeCondition;
    std::vector<std::string> possibleTypes;
    SelectionSetPtr selectionSet;
};

struct CompilationContext {
    std::shared_ptr<const Schema> schema;
    OrderedMap<Operation> operations;
    OrderedMap<Fragment> fragments;
    // Enums, input objects and custom scalars, in discovery order
    std::vector<std::string> typesUsed;
    CompilerOptions options;

    const Fragment* fragmentNamed(const std::string& name) const { return fragments.find(name); }
};

// ═══════════════════════════════════════════
//  compileToIR
//  Resolves every operation and fragment of `document` against
//  `schema`. Throws GraphQLError for unknown types, fields and
//  fragments, fragment cycles, and anonymous or duplicate operations.
// ═══════════════════════════════════════════
CompilationContext compileToIR(std::shared_ptr<const Schema> schema,
                               const ast::Document& document,
                               const CompilerOptions& options = {});

} // namespace gqlir::ir

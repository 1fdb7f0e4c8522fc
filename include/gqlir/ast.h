#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/ast.h — Syntax tree of executable GraphQL documents
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "type_ref.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gqlir::ast {

// ── Literal or variable value ──
struct Value {
    enum class Kind { Variable, Int, Float, String, Boolean, Null, Enum, List, Object };

    Kind kind = Kind::Null;
    // Variable name, numeric literal text, string contents or enum name
    std::string text;
    bool boolean = false;
    std::vector<Value> values;
    std::vector<std::pair<std::string, Value>> fields;

    static Value variable(std::string name) { return scalar(Kind::Variable, std::move(name)); }
    static Value string(std::string text) { return scalar(Kind::String, std::move(text)); }
    static Value enumValue(std::string name) { return scalar(Kind::Enum, std::move(name)); }
    static Value integer(std::string literal) { return scalar(Kind::Int, std::move(literal)); }
    static Value boolValue(bool b) {
        Value v;
        v.kind = Kind::Boolean;
        v.boolean = b;
        return v;
    }

private:
    static Value scalar(Kind kind, std::string text) {
        Value v;
        v.kind = kind;
        v.text = std::move(text);
        return v;
    }
};

struct Argument {
    std::string name;
    Value value;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    SourceLocation location;
};

struct Selection {
    enum class Kind { Field, FragmentSpread, InlineFragment };

    Kind kind = Kind::Field;
    std::string alias;                          // Field only, may be empty
    std::string name;                           // field or fragment name
    std::optional<std::string> typeCondition;   // InlineFragment only
    std::vector<Argument> arguments;
    std::vector<Directive> directives;
    std::vector<Selection> selectionSet;
    SourceLocation location;

    const std::string& responseKey() const { return alias.empty() ? name : alias; }
};

struct VariableDefinition {
    std::string name;
    TypeRef type;
    std::optional<Value> defaultValue;
};

struct OperationDefinition {
    OperationType operation = OperationType::Query;
    std::string name;
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    std::vector<Selection> selectionSet;
    SourceLocation location;
    std::optional<std::string> filePath;
};

struct FragmentDefinition {
    std::string name;
    std::string typeCondition;
    std::vector<Directive> directives;
    std::vector<Selection> selectionSet;
    SourceLocation location;
    std::optional<std::string> filePath;
};

struct Document {
    enum class DefinitionKind { Operation, Fragment };

    std::vector<OperationDefinition> operations;
    std::vector<FragmentDefinition> fragments;
    // Kind of each definition in source order
    std::vector<DefinitionKind> definitionOrder;
};

// ── Argument values as plain JSON; variables become
//    {"kind": "Variable", "variableName": name} ──
nlohmann::json valueToJson(const Value& value);

// Removes every explicit __typename selection, then prepends one to
// each field and fragment-definition selection set. Operation root
// selection sets are left without it.
Document addTypenameFields(const Document& document);

// Definitions of all documents, in order.
Document concatDocuments(const std::vector<Document>& documents);

} // namespace gqlir::ast

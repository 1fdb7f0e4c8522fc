// ═══════════════════════════════════════════════════════════════════
//  src/printer.cpp — Canonical GraphQL printing
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/printer.h"
#include "gqlir/json_utils.h"

#include <string>
#include <vector>

namespace gqlir {

namespace {

// Joins the non-empty parts
std::string join(const std::vector<std::string>& parts, const std::string& separator = "") {
    std::string result;
    bool first = true;
    for (auto& part : parts) {
        if (part.empty()) continue;
        if (!first) result += separator;
        result += part;
        first = false;
    }
    return result;
}

std::string wrap(const std::string& start, const std::string& maybe, const std::string& end = "") {
    return maybe.empty() ? "" : start + maybe + end;
}

std::string indent(const std::string& text) {
    if (text.empty()) return text;
    std::string result = "  ";
    for (char c : text) {
        result += c;
        if (c == '\n') result += "  ";
    }
    return result;
}

std::string block(const std::vector<std::string>& items) {
    if (items.empty()) return "";
    return "{\n" + indent(join(items, "\n")) + "\n}";
}

template <typename T>
std::vector<std::string> printAll(const std::vector<T>& nodes) {
    std::vector<std::string> printed;
    printed.reserve(nodes.size());
    for (auto& node : nodes) printed.push_back(print(node));
    return printed;
}

std::string printArguments(const std::vector<ast::Argument>& args) {
    std::vector<std::string> printed;
    for (auto& arg : args) printed.push_back(arg.name + ": " + print(arg.value));
    return wrap("(", join(printed, ", "), ")");
}

std::string printSelectionSet(const std::vector<ast::Selection>& selections) {
    return block(printAll(selections));
}

std::string printVariableDefinition(const ast::VariableDefinition& variable) {
    std::string result = "$" + variable.name + ": " + print(variable.type);
    if (variable.defaultValue) result += " = " + print(*variable.defaultValue);
    return result;
}

} // namespace

std::string print(const ast::Value& value) {
    using Kind = ast::Value::Kind;
    switch (value.kind) {
        case Kind::Variable: return "$" + value.text;
        case Kind::Int:
        case Kind::Float:
        case Kind::Enum: return value.text;
        case Kind::String: return quote(value.text);
        case Kind::Boolean: return value.boolean ? "true" : "false";
        case Kind::Null: return "null";
        case Kind::List: return "[" + join(printAll(value.values), ", ") + "]";
        case Kind::Object: {
            std::vector<std::string> fields;
            for (auto& [name, fieldValue] : value.fields) {
                fields.push_back(name + ": " + print(fieldValue));
            }
            return "{" + join(fields, ", ") + "}";
        }
    }
    return "null";
}

std::string print(const TypeRef& type) {
    return type.toString();
}

std::string print(const ast::Directive& directive) {
    return "@" + directive.name + printArguments(directive.arguments);
}

std::string print(const ast::Selection& selection) {
    auto directives = join(printAll(selection.directives), " ");
    switch (selection.kind) {
        case ast::Selection::Kind::Field:
            return join({
                wrap("", selection.alias, ": ") + selection.name + printArguments(selection.arguments),
                directives,
                printSelectionSet(selection.selectionSet)
            }, " ");
        case ast::Selection::Kind::FragmentSpread:
            return "..." + selection.name + wrap(" ", directives);
        case ast::Selection::Kind::InlineFragment:
            return join({
                "...",
                wrap("on ", selection.typeCondition.value_or("")),
                directives,
                printSelectionSet(selection.selectionSet)
            }, " ");
    }
    return "";
}

std::string print(const ast::OperationDefinition& operation) {
    std::vector<std::string> variables;
    for (auto& variable : operation.variables) variables.push_back(printVariableDefinition(variable));
    auto varDefs = wrap("(", join(variables, ", "), ")");
    auto directives = join(printAll(operation.directives), " ");
    auto selectionSet = printSelectionSet(operation.selectionSet);

    if (operation.name.empty() && directives.empty() && varDefs.empty() &&
        operation.operation == OperationType::Query) {
        return selectionSet;
    }
    return join({
        toString(operation.operation),
        join({operation.name, varDefs}),
        directives,
        selectionSet
    }, " ");
}

std::string print(const ast::FragmentDefinition& fragment) {
    return "fragment " + fragment.name + " on " + fragment.typeCondition + " " +
           wrap("", join(printAll(fragment.directives), " "), " ") +
           printSelectionSet(fragment.selectionSet);
}

std::string print(const ast::Document& document) {
    std::vector<std::string> definitions;
    std::size_t nextOperation = 0, nextFragment = 0;
    for (auto kind : document.definitionOrder) {
        if (kind == ast::Document::DefinitionKind::Operation && nextOperation < document.operations.size()) {
            definitions.push_back(print(document.operations[nextOperation++]));
        } else if (kind == ast::Document::DefinitionKind::Fragment && nextFragment < document.fragments.size()) {
            definitions.push_back(print(document.fragments[nextFragment++]));
        }
    }
    // Definitions added without recording their order go last
    while (nextOperation < document.operations.size()) {
        definitions.push_back(print(document.operations[nextOperation++]));
    }
    while (nextFragment < document.fragments.size()) {
        definitions.push_back(print(document.fragments[nextFragment++]));
    }
    return join(definitions, "\n\n") + "\n";
}

} // namespace gqlir

// ═══════════════════════════════════════════════════════════════════
//  src/ast.cpp — Value conversion and document transforms
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/ast.h"

#include <algorithm>
#include <stdexcept>

namespace gqlir::ast {

nlohmann::json valueToJson(const Value& value) {
    switch (value.kind) {
        case Value::Kind::Variable:
            return nlohmann::json{{"kind", "Variable"}, {"variableName", value.text}};
        case Value::Kind::Int:
            try {
                return nlohmann::json(std::stoll(value.text));
            } catch (const std::out_of_range&) {
                return nlohmann::json(std::stod(value.text));
            }
        case Value::Kind::Float:
            return nlohmann::json(std::stod(value.text));
        case Value::Kind::String:
        case Value::Kind::Enum:
            return nlohmann::json(value.text);
        case Value::Kind::Boolean:
            return nlohmann::json(value.boolean);
        case Value::Kind::Null:
            return nlohmann::json(nullptr);
        case Value::Kind::List: {
            auto array = nlohmann::json::array();
            for (auto& item : value.values) array.push_back(valueToJson(item));
            return array;
        }
        case Value::Kind::Object: {
            auto object = nlohmann::json::object();
            for (auto& [name, fieldValue] : value.fields) object[name] = valueToJson(fieldValue);
            return object;
        }
    }
    return nullptr;
}

namespace {

Selection typenameField() {
    Selection field;
    field.kind = Selection::Kind::Field;
    field.name = "__typename";
    return field;
}

bool isTypenameField(const Selection& selection) {
    return selection.kind == Selection::Kind::Field && selection.name == "__typename";
}

// `prepend` is true for selection sets that belong to a field or
// fragment definition.
std::vector<Selection> withTypename(const std::vector<Selection>& selections, bool prepend) {
    std::vector<Selection> result;
    if (prepend) result.push_back(typenameField());
    for (auto& selection : selections) {
        if (isTypenameField(selection)) continue;
        Selection copy = selection;
        if (!copy.selectionSet.empty()) {
            copy.selectionSet = withTypename(selection.selectionSet,
                                             selection.kind == Selection::Kind::Field);
        }
        result.push_back(std::move(copy));
    }
    return result;
}

} // namespace

Document addTypenameFields(const Document& document) {
    Document result = document;
    for (auto& operation : result.operations) {
        operation.selectionSet = withTypename(operation.selectionSet, false);
    }
    for (auto& fragment : result.fragments) {
        fragment.selectionSet = withTypename(fragment.selectionSet, true);
    }
    return result;
}

Document concatDocuments(const std::vector<Document>& documents) {
    Document result;
    for (auto& document : documents) {
        result.operations.insert(result.operations.end(),
                                 document.operations.begin(), document.operations.end());
        result.fragments.insert(result.fragments.end(),
                                document.fragments.begin(), document.fragments.end());
        result.definitionOrder.insert(result.definitionOrder.end(),
                                      document.definitionOrder.begin(), document.definitionOrder.end());
    }
    return result;
}

} // namespace gqlir::ast

// ═══════════════════════════════════════════════════════════════════
//  src/serialize.cpp — JSON output of the legacy IR
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/serialize.h"
#include "gqlir/errors.h"

namespace gqlir {

namespace {

using nlohmann::json;

json serializeArgs(const std::vector<ir::Argument>& args) {
    auto result = json::array();
    for (auto& arg : args) {
        json j{{"name", arg.name}, {"value", arg.value}};
        if (arg.type) j["type"] = arg.type->toString();
        result.push_back(std::move(j));
    }
    return result;
}

json serializeInlineFragment(const legacy::InlineFragment& fragment);

json serializeField(const legacy::Field& field) {
    json j{
        {"responseName", field.responseName},
        {"fieldName", field.fieldName},
        {"type", field.type.toString()},
        {"isConditional", field.isConditional},
        {"isDeprecated", field.isDeprecated}
    };
    if (!field.args.empty()) j["args"] = serializeArgs(field.args);
    setIfPresent(j, "description", field.description);
    setIfPresent(j, "deprecationReason", field.deprecationReason);

    if (field.hasSelectionSet) {
        j["fields"] = json::array();
        for (auto& nested : field.fields) j["fields"].push_back(serializeField(nested));
        j["fragmentSpreads"] = field.fragmentSpreads;
        j["inlineFragments"] = json::array();
        for (auto& fragment : field.inlineFragments) {
            j["inlineFragments"].push_back(serializeInlineFragment(fragment));
        }
    }
    return j;
}

json serializeFields(const std::vector<legacy::Field>& fields) {
    auto result = json::array();
    for (auto& field : fields) result.push_back(serializeField(field));
    return result;
}

json serializeInlineFragment(const legacy::InlineFragment& fragment) {
    return json{
        {"typeCondition", fragment.typeCondition},
        {"possibleTypes", fragment.possibleTypes},
        {"fields", serializeFields(fragment.fields)},
        {"fragmentSpreads", fragment.fragmentSpreads}
    };
}

json serializeInlineFragments(const std::vector<legacy::InlineFragment>& fragments) {
    auto result = json::array();
    for (auto& fragment : fragments) result.push_back(serializeInlineFragment(fragment));
    return result;
}

json serializeOperation(const legacy::CompiledOperation& operation) {
    auto variables = json::array();
    for (auto& variable : operation.variables) {
        variables.push_back({{"name", variable.name}, {"type", variable.type.toString()}});
    }
    json j{
        {"operationName", operation.operationName},
        {"operationType", toString(operation.operationType)},
        {"rootType", operation.rootType},
        {"variables", std::move(variables)},
        {"source", operation.source},
        {"fields", serializeFields(operation.fields)},
        {"fragmentSpreads", operation.fragmentSpreads},
        {"inlineFragments", serializeInlineFragments(operation.inlineFragments)},
        {"fragmentsReferenced", operation.fragmentsReferenced},
        {"sourceWithFragments", operation.sourceWithFragments}
    };
    setIfPresent(j, "filePath", operation.filePath);
    setIfPresent(j, "operationId", operation.operationId);
    return j;
}

json serializeFragment(const legacy::CompiledFragment& fragment) {
    json j{
        {"fragmentName", fragment.fragmentName},
        {"source", fragment.source},
        {"typeCondition", fragment.typeCondition},
        {"possibleTypes", fragment.possibleTypes},
        {"fields", serializeFields(fragment.fields)},
        {"fragmentSpreads", fragment.fragmentSpreads},
        {"inlineFragments", serializeInlineFragments(fragment.inlineFragments)}
    };
    setIfPresent(j, "filePath", fragment.filePath);
    return j;
}

json serializeType(const NamedType& type) {
    json j{{"name", type.name}};
    setIfPresent(j, "description", type.description);

    switch (type.kind) {
        case TypeKind::Enum: {
            j["kind"] = "EnumType";
            j["values"] = json::array();
            for (auto& value : type.enumValues) {
                json v{{"name", value.name}, {"isDeprecated", value.isDeprecated}};
                setIfPresent(v, "description", value.description);
                setIfPresent(v, "deprecationReason", value.deprecationReason);
                j["values"].push_back(std::move(v));
            }
            break;
        }
        case TypeKind::InputObject: {
            j["kind"] = "InputObjectType";
            j["fields"] = json::array();
            for (auto& field : type.inputFields) {
                json f{{"name", field.name}, {"type", field.type.toString()}};
                setIfPresent(f, "description", field.description);
                setIfPresent(f, "defaultValue", field.defaultValue);
                j["fields"].push_back(std::move(f));
            }
            break;
        }
        default:
            j["kind"] = "ScalarType";
            break;
    }
    return j;
}

} // namespace

nlohmann::json serializeToJSON(const legacy::LegacyCompilationContext& context) {
    json result{
        {"operations", json::array()},
        {"fragments", json::array()},
        {"typesUsed", json::array()}
    };
    for (auto& [name, operation] : context.operations) {
        result["operations"].push_back(serializeOperation(operation));
    }
    for (auto& [name, fragment] : context.fragments) {
        result["fragments"].push_back(serializeFragment(fragment));
    }
    for (auto& typeName : context.typesUsed) {
        auto* type = context.schema ? context.schema->type(typeName) : nullptr;
        if (!type) {
            throw CompilationError("Type \"" + typeName + "\" is not defined in the schema");
        }
        result["typesUsed"].push_back(serializeType(*type));
    }
    return result;
}

nlohmann::json operationIdManifest(const legacy::LegacyCompilationContext& context) {
    auto manifest = json::object();
    for (auto& [name, operation] : context.operations) {
        if (!operation.operationId) {
            throw CompilationError("Operation \"" + name +
                                   "\" has no operation id; enable generateOperationIds");
        }
        manifest[*operation.operationId] = toJson(OperationIdEntry{name, operation.sourceWithFragments});
    }
    return manifest;
}

} // namespace gqlir

// ═══════════════════════════════════════════════════════════════════
//  src/schema.cpp — Type system lookups, validation and introspection
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/schema.h"
#include "gqlir/json_utils.h"

#include <algorithm>
#include <array>

namespace gqlir {

namespace {

constexpr std::array<const char*, 5> kBuiltInScalars = {"Int", "Float", "String", "Boolean", "ID"};

NamedType builtInScalar(const char* name) {
    NamedType type;
    type.kind = TypeKind::Scalar;
    type.name = name;
    return type;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

const char* toString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar: return "SCALAR";
        case TypeKind::Object: return "OBJECT";
        case TypeKind::Interface: return "INTERFACE";
        case TypeKind::Union: return "UNION";
        case TypeKind::Enum: return "ENUM";
        case TypeKind::InputObject: return "INPUT_OBJECT";
    }
    return "SCALAR";
}

const FieldDefinition* NamedType::field(const std::string& fieldName) const {
    for (auto& f : fields) {
        if (f.name == fieldName) return &f;
    }
    return nullptr;
}

// ═══════════════════════════════════════════
//  Schema
// ═══════════════════════════════════════════

Schema::Schema() {
    for (auto* name : kBuiltInScalars) {
        types_.insert(name, builtInScalar(name));
    }
    typenameField_.name = "__typename";
    typenameField_.description = "The name of the current Object type at runtime.";
    typenameField_.type = TypeRef("String").nonNull();
}

bool Schema::isBuiltInScalar(const std::string& name) {
    return std::find(kBuiltInScalars.begin(), kBuiltInScalars.end(), name) != kBuiltInScalars.end();
}

NamedType& Schema::addType(NamedType type) {
    if (type.name.empty()) {
        throw GraphQLError("Type definition without a name");
    }
    if (type.name.rfind("__", 0) == 0) {
        throw GraphQLError("Name \"" + type.name + "\" must not begin with \"__\", "
                           "which is reserved by GraphQL introspection");
    }
    if (types_.contains(type.name)) {
        if (!isBuiltInScalar(type.name)) {
            throw GraphQLError("There can be only one type named \"" + type.name + "\"");
        }
        auto name = type.name;
        return types_.insertOrAssign(name, std::move(type));
    }
    auto name = type.name;
    types_.insert(name, std::move(type));
    return types_.at(name);
}

void Schema::setRootType(OperationType operation, std::string typeName) {
    switch (operation) {
        case OperationType::Query: queryType_ = std::move(typeName); break;
        case OperationType::Mutation: mutationType_ = std::move(typeName); break;
        case OperationType::Subscription: subscriptionType_ = std::move(typeName); break;
    }
}

const NamedType* Schema::type(const std::string& name) const {
    return types_.find(name);
}

const NamedType& Schema::typeNamed(const std::string& name) const {
    if (auto* t = types_.find(name)) return *t;
    throw GraphQLError("Unknown type \"" + name + "\"");
}

const NamedType* Schema::rootType(OperationType operation) const {
    const std::optional<std::string>* name = nullptr;
    switch (operation) {
        case OperationType::Query: name = &queryType_; break;
        case OperationType::Mutation: name = &mutationType_; break;
        case OperationType::Subscription: name = &subscriptionType_; break;
    }
    if (!name || !*name) return nullptr;
    return types_.find(**name);
}

std::vector<std::string> Schema::possibleTypes(const std::string& name) const {
    const auto& type = typeNamed(name);
    switch (type.kind) {
        case TypeKind::Object:
            return {type.name};
        case TypeKind::Union:
            return type.members;
        case TypeKind::Interface: {
            std::vector<std::string> result;
            for (auto& [typeName, candidate] : types_) {
                if (candidate.kind == TypeKind::Object && contains(candidate.interfaces, name)) {
                    result.push_back(typeName);
                }
            }
            return result;
        }
        default:
            throw GraphQLError("Type \"" + name + "\" is not a composite type");
    }
}

const FieldDefinition* Schema::fieldDefinition(const NamedType& parent,
                                               const std::string& fieldName) const {
    if (fieldName == typenameField_.name && parent.isComposite()) {
        return &typenameField_;
    }
    if (parent.kind != TypeKind::Object && parent.kind != TypeKind::Interface) {
        return nullptr;
    }
    return parent.field(fieldName);
}

void Schema::checkTypeRef(const TypeRef& ref, const std::string& context, bool input) const {
    auto* named = type(ref.namedType());
    if (!named) {
        throw GraphQLError("Unknown type \"" + ref.namedType() + "\" referenced by " + context);
    }
    if (input && !named->isInput()) {
        throw GraphQLError("The type of " + context + " must be an input type but got \"" +
                           ref.toString() + "\"");
    }
    if (!input && named->kind == TypeKind::InputObject) {
        throw GraphQLError("The type of " + context + " must be an output type but got \"" +
                           ref.toString() + "\"");
    }
}

void Schema::validate() {
    if (!queryType_ && types_.contains("Query")) queryType_ = "Query";
    if (!mutationType_ && types_.contains("Mutation")) mutationType_ = "Mutation";
    if (!subscriptionType_ && types_.contains("Subscription")) subscriptionType_ = "Subscription";

    if (!queryType_) {
        throw GraphQLError("Schema does not define a query root type");
    }
    for (auto operation : {OperationType::Query, OperationType::Mutation, OperationType::Subscription}) {
        const std::optional<std::string>& name =
            operation == OperationType::Query ? queryType_ :
            operation == OperationType::Mutation ? mutationType_ : subscriptionType_;
        if (!name) continue;
        auto* root = type(*name);
        if (!root || root->kind != TypeKind::Object) {
            throw GraphQLError(std::string("Root ") + toString(operation) +
                               " type \"" + *name + "\" must be an object type");
        }
    }

    for (auto& [name, t] : types_) {
        for (auto& field : t.fields) {
            auto context = "field \"" + name + "." + field.name + "\"";
            checkTypeRef(field.type, context, false);
            for (auto& arg : field.args) {
                checkTypeRef(arg.type, "argument \"" + name + "." + field.name + "(" + arg.name + ":)\"", true);
            }
        }
        for (auto& field : t.inputFields) {
            checkTypeRef(field.type, "input field \"" + name + "." + field.name + "\"", true);
        }
        for (auto& iface : t.interfaces) {
            auto* target = type(iface);
            if (!target || target->kind != TypeKind::Interface) {
                throw GraphQLError("Type \"" + name + "\" must only implement Interface types, "
                                   "it cannot implement \"" + iface + "\"");
            }
        }
        for (auto& member : t.members) {
            auto* target = type(member);
            if (!target || target->kind != TypeKind::Object) {
                throw GraphQLError("Union type \"" + name + "\" can only include Object types, "
                                   "it cannot include \"" + member + "\"");
            }
        }
    }
}

// ═══════════════════════════════════════════
//  Introspection loader
// ═══════════════════════════════════════════

namespace {

TypeRef typeRefFromIntrospection(const nlohmann::json& j) {
    auto kind = j.at("kind").get<std::string>();
    if (kind == "NON_NULL") return typeRefFromIntrospection(j.at("ofType")).nonNull();
    if (kind == "LIST") return typeRefFromIntrospection(j.at("ofType")).listOf();
    return TypeRef(j.at("name").get<std::string>());
}

InputValueDefinition inputValueFromIntrospection(const nlohmann::json& j) {
    InputValueDefinition value;
    value.name = j.at("name").get<std::string>();
    value.description = optionalString(j, "description");
    value.type = typeRefFromIntrospection(j.at("type"));
    value.defaultValue = optionalString(j, "defaultValue");
    return value;
}

std::vector<std::string> namesOf(const nlohmann::json& j, const char* key) {
    std::vector<std::string> names;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return names;
    for (auto& entry : *it) names.push_back(entry.at("name").get<std::string>());
    return names;
}

TypeKind typeKindFromIntrospection(const std::string& kind) {
    if (kind == "SCALAR") return TypeKind::Scalar;
    if (kind == "OBJECT") return TypeKind::Object;
    if (kind == "INTERFACE") return TypeKind::Interface;
    if (kind == "UNION") return TypeKind::Union;
    if (kind == "ENUM") return TypeKind::Enum;
    if (kind == "INPUT_OBJECT") return TypeKind::InputObject;
    throw GraphQLError("Unknown type kind \"" + kind + "\" in introspection result");
}

NamedType typeFromIntrospection(const nlohmann::json& j) {
    NamedType type;
    type.kind = typeKindFromIntrospection(j.at("kind").get<std::string>());
    type.name = j.at("name").get<std::string>();
    type.description = optionalString(j, "description");

    if (auto it = j.find("fields"); it != j.end() && it->is_array()) {
        for (auto& f : *it) {
            FieldDefinition field;
            field.name = f.at("name").get<std::string>();
            field.description = optionalString(f, "description");
            field.type = typeRefFromIntrospection(f.at("type"));
            field.isDeprecated = f.value("isDeprecated", false);
            field.deprecationReason = optionalString(f, "deprecationReason");
            if (auto args = f.find("args"); args != f.end() && args->is_array()) {
                for (auto& a : *args) field.args.push_back(inputValueFromIntrospection(a));
            }
            type.fields.push_back(std::move(field));
        }
    }
    if (auto it = j.find("inputFields"); it != j.end() && it->is_array()) {
        for (auto& f : *it) type.inputFields.push_back(inputValueFromIntrospection(f));
    }
    if (auto it = j.find("enumValues"); it != j.end() && it->is_array()) {
        for (auto& v : *it) {
            EnumValueDefinition value;
            value.name = v.at("name").get<std::string>();
            value.description = optionalString(v, "description");
            value.isDeprecated = v.value("isDeprecated", false);
            value.deprecationReason = optionalString(v, "deprecationReason");
            type.enumValues.push_back(std::move(value));
        }
    }
    type.interfaces = namesOf(j, "interfaces");
    if (type.kind == TypeKind::Union) type.members = namesOf(j, "possibleTypes");
    return type;
}

} // namespace

std::shared_ptr<Schema> schemaFromIntrospection(const nlohmann::json& introspection) {
    const nlohmann::json* root = &introspection;
    if (root->contains("data")) root = &root->at("data");
    if (!root->contains("__schema")) {
        throw GraphQLError("Introspection result is missing \"__schema\"");
    }
    const auto& schemaJson = root->at("__schema");

    auto schema = std::make_shared<Schema>();
    try {
        for (auto& typeJson : schemaJson.at("types")) {
            auto name = typeJson.at("name").get<std::string>();
            if (name.rfind("__", 0) == 0) continue;  // introspection types
            schema->addType(typeFromIntrospection(typeJson));
        }
        auto rootName = [&schemaJson](const char* key) -> std::optional<std::string> {
            auto it = schemaJson.find(key);
            if (it == schemaJson.end() || it->is_null()) return std::nullopt;
            return it->at("name").get<std::string>();
        };
        if (auto name = rootName("queryType")) schema->setRootType(OperationType::Query, *name);
        if (auto name = rootName("mutationType")) schema->setRootType(OperationType::Mutation, *name);
        if (auto name = rootName("subscriptionType")) schema->setRootType(OperationType::Subscription, *name);
    } catch (const nlohmann::json::exception& e) {
        throw GraphQLError(std::string("Malformed introspection result: ") + e.what());
    }

    schema->validate();
    return schema;
}

} // namespace gqlir

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/schema.h — GraphQL type system used to resolve documents
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto schema = buildSchema(R"(
//        type Query { pet: Pet }
//        interface Pet { name: String }
//        type Dog implements Pet { name: String barkVolume: Int }
//        type Cat implements Pet { name: String lives: Int }
//    )");
//    schema->possibleTypes("Pet");   // {"Dog", "Cat"}
//
//  Schemas are built once and then shared read-only
//  (std::shared_ptr<const Schema>) by every compilation stage.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "ordered_map.h"
#include "type_ref.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gqlir {

enum class TypeKind { Scalar, Object, Interface, Union, Enum, InputObject };

const char* toString(TypeKind kind);

struct InputValueDefinition {
    std::string name;
    std::optional<std::string> description;
    TypeRef type;
    // Default as a GraphQL literal, e.g. `10` or `"abc"`
    std::optional<std::string> defaultValue;
};

struct FieldDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<InputValueDefinition> args;
    TypeRef type;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;
};

struct EnumValueDefinition {
    std::string name;
    std::optional<std::string> description;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;
};

struct NamedType {
    TypeKind kind = TypeKind::Scalar;
    std::string name;
    std::optional<std::string> description;
    std::vector<FieldDefinition> fields;          // Object, Interface
    std::vector<std::string> interfaces;          // Object, Interface
    std::vector<std::string> members;             // Union
    std::vector<EnumValueDefinition> enumValues;  // Enum
    std::vector<InputValueDefinition> inputFields; // InputObject

    const FieldDefinition* field(const std::string& fieldName) const;

    bool isComposite() const {
        return kind == TypeKind::Object || kind == TypeKind::Interface || kind == TypeKind::Union;
    }
    bool isAbstract() const { return kind == TypeKind::Interface || kind == TypeKind::Union; }
    bool isLeaf() const { return kind == TypeKind::Scalar || kind == TypeKind::Enum; }
    bool isInput() const { return isLeaf() || kind == TypeKind::InputObject; }
};

// ═══════════════════════════════════════════
//  class Schema
// ═══════════════════════════════════════════
class Schema {
public:
    // Starts with the built-in scalars Int, Float, String, Boolean, ID.
    Schema();

    // ── Construction ──
    // Adds a type; a definition for a built-in scalar replaces it,
    // any other duplicate name is an error.
    NamedType& addType(NamedType type);
    void setRootType(OperationType operation, std::string typeName);

    // Checks that every referenced type exists and has a fitting kind,
    // and resolves default root types (Query/Mutation/Subscription).
    void validate();

    // ── Lookup ──
    const NamedType* type(const std::string& name) const;
    // Like type(), but throws GraphQLError for unknown names.
    const NamedType& typeNamed(const std::string& name) const;
    const NamedType* rootType(OperationType operation) const;
    const OrderedMap<NamedType>& types() const { return types_; }

    // Concrete object types `name` may resolve to at runtime, in schema
    // order for interfaces and declaration order for unions.
    std::vector<std::string> possibleTypes(const std::string& name) const;

    // Field of a composite type, including the __typename meta field.
    const FieldDefinition* fieldDefinition(const NamedType& parent,
                                           const std::string& fieldName) const;

    static bool isBuiltInScalar(const std::string& name);

private:
    OrderedMap<NamedType> types_;
    std::optional<std::string> queryType_;
    std::optional<std::string> mutationType_;
    std::optional<std::string> subscriptionType_;
    FieldDefinition typenameField_;

    void checkTypeRef(const TypeRef& ref, const std::string& context, bool input) const;
};

// ── Loaders ──

// Type-system SDL. Directive definitions are accepted and ignored;
// type extensions are rejected.
std::shared_ptr<Schema> buildSchema(const std::string& sdl);

// Result of the standard introspection query, either the bare
// {"__schema": ...} object or wrapped in {"data": ...}.
std::shared_ptr<Schema> schemaFromIntrospection(const nlohmann::json& introspection);

} // namespace gqlir

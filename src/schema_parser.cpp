// ═══════════════════════════════════════════════════════════════════
//  src/schema_parser.cpp — Type-system SDL parsing into a Schema
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/parser.h"
#include "gqlir/printer.h"

namespace gqlir {

namespace detail {

namespace {

constexpr const char* kDefaultDeprecationReason = "No longer supported";

} // namespace

void SchemaParser::parseInto(Schema& schema) {
    if (atEnd()) fail("Unexpected <EOF>");

    while (!atEnd()) {
        auto description = parseDescription();
        skipIgnored();

        if (peekKeyword("schema")) {
            parseSchemaDefinition(schema);
        } else if (peekKeyword("directive")) {
            skipDirectiveDefinition();
        } else if (peekKeyword("extend")) {
            fail("Type extensions are not supported");
        } else if (peekKeyword("scalar")) {
            expectKeyword("scalar");
            NamedType type;
            type.kind = TypeKind::Scalar;
            type.name = parseName();
            type.description = description;
            parseDirectives(true);
            schema.addType(std::move(type));
        } else if (peekKeyword("type")) {
            expectKeyword("type");
            auto type = parseObjectLike(TypeKind::Object);
            type.description = description;
            schema.addType(std::move(type));
        } else if (peekKeyword("interface")) {
            expectKeyword("interface");
            auto type = parseObjectLike(TypeKind::Interface);
            type.description = description;
            schema.addType(std::move(type));
        } else if (peekKeyword("union")) {
            auto type = parseUnion();
            type.description = description;
            schema.addType(std::move(type));
        } else if (peekKeyword("enum")) {
            auto type = parseEnum();
            type.description = description;
            schema.addType(std::move(type));
        } else if (peekKeyword("input")) {
            auto type = parseInputObject();
            type.description = description;
            schema.addType(std::move(type));
        } else if (isNameStart(peek())) {
            auto start = pos_;
            auto name = parseName();
            pos_ = start;
            fail("Unexpected Name \"" + name + "\"");
        } else {
            unexpected();
        }
    }
}

std::optional<std::string> SchemaParser::parseDescription() {
    skipIgnored();
    if (peek() != '"') return std::nullopt;
    return parseStringLiteral();
}

void SchemaParser::parseSchemaDefinition(Schema& schema) {
    expectKeyword("schema");
    parseDirectives(true);
    expect('{');
    do {
        auto operation = parseName();
        expect(':');
        auto typeName = parseName();
        if (operation == "query") {
            schema.setRootType(OperationType::Query, typeName);
        } else if (operation == "mutation") {
            schema.setRootType(OperationType::Mutation, typeName);
        } else if (operation == "subscription") {
            schema.setRootType(OperationType::Subscription, typeName);
        } else {
            fail("Unexpected operation type \"" + operation + "\"");
        }
    } while (!consumeIf('}'));
}

void SchemaParser::skipDirectiveDefinition() {
    expectKeyword("directive");
    expect('@');
    parseName();
    parseArgumentDefinitions();
    if (peekKeyword("repeatable")) expectKeyword("repeatable");
    expectKeyword("on");
    consumeIf('|');
    do {
        parseName();
    } while (consumeIf('|'));
}

std::vector<std::string> SchemaParser::parseImplementsInterfaces() {
    std::vector<std::string> interfaces;
    if (!peekKeyword("implements")) return interfaces;
    expectKeyword("implements");
    consumeIf('&');
    do {
        interfaces.push_back(parseName());
    } while (consumeIf('&'));
    return interfaces;
}

NamedType SchemaParser::parseObjectLike(TypeKind kind) {
    NamedType type;
    type.kind = kind;
    type.name = parseName();
    type.interfaces = parseImplementsInterfaces();
    parseDirectives(true);
    if (consumeIf('{')) {
        do {
            type.fields.push_back(parseFieldDefinition());
        } while (!consumeIf('}'));
    }
    return type;
}

FieldDefinition SchemaParser::parseFieldDefinition() {
    FieldDefinition field;
    field.description = parseDescription();
    field.name = parseName();
    field.args = parseArgumentDefinitions();
    expect(':');
    field.type = parseTypeRef();
    applyDeprecation(parseDirectives(true), field.isDeprecated, field.deprecationReason);
    return field;
}

std::vector<InputValueDefinition> SchemaParser::parseArgumentDefinitions() {
    std::vector<InputValueDefinition> args;
    if (!consumeIf('(')) return args;
    do {
        args.push_back(parseInputValueDefinition());
    } while (!consumeIf(')'));
    return args;
}

InputValueDefinition SchemaParser::parseInputValueDefinition() {
    InputValueDefinition value;
    value.description = parseDescription();
    value.name = parseName();
    expect(':');
    value.type = parseTypeRef();
    if (consumeIf('=')) {
        value.defaultValue = print(parseValue(true));
    }
    parseDirectives(true);
    return value;
}

NamedType SchemaParser::parseUnion() {
    expectKeyword("union");
    NamedType type;
    type.kind = TypeKind::Union;
    type.name = parseName();
    parseDirectives(true);
    if (consumeIf('=')) {
        consumeIf('|');
        do {
            type.members.push_back(parseName());
        } while (consumeIf('|'));
    }
    return type;
}

NamedType SchemaParser::parseEnum() {
    expectKeyword("enum");
    NamedType type;
    type.kind = TypeKind::Enum;
    type.name = parseName();
    parseDirectives(true);
    if (consumeIf('{')) {
        do {
            EnumValueDefinition value;
            value.description = parseDescription();
            value.name = parseName();
            if (value.name == "true" || value.name == "false" || value.name == "null") {
                fail("Name \"" + value.name + "\" is reserved and cannot be used for an enum value");
            }
            applyDeprecation(parseDirectives(true), value.isDeprecated, value.deprecationReason);
            type.enumValues.push_back(std::move(value));
        } while (!consumeIf('}'));
    }
    return type;
}

NamedType SchemaParser::parseInputObject() {
    expectKeyword("input");
    NamedType type;
    type.kind = TypeKind::InputObject;
    type.name = parseName();
    parseDirectives(true);
    if (consumeIf('{')) {
        do {
            type.inputFields.push_back(parseInputValueDefinition());
        } while (!consumeIf('}'));
    }
    return type;
}

void SchemaParser::applyDeprecation(const std::vector<ast::Directive>& directives,
                                    bool& isDeprecated,
                                    std::optional<std::string>& reason) {
    for (auto& directive : directives) {
        if (directive.name != "deprecated") continue;
        isDeprecated = true;
        reason = kDefaultDeprecationReason;
        for (auto& arg : directive.arguments) {
            if (arg.name == "reason" && arg.value.kind == ast::Value::Kind::String) {
                reason = arg.value.text;
            }
        }
    }
}

} // namespace detail

std::shared_ptr<Schema> buildSchema(const std::string& sdl) {
    auto schema = std::make_shared<Schema>();
    detail::SchemaParser parser(sdl);
    parser.parseInto(*schema);
    schema->validate();
    return schema;
}

} // namespace gqlir

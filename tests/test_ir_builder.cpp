// ═══════════════════════════════════════════════════════════════════
//  test_ir_builder.cpp — Typed IR construction tests
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlir/ir.h>
#include <gqlir/parser.h>
#include "pet_schema.h"

using namespace gqlir;

namespace {

ir::CompilationContext compile(const std::string& source, const CompilerOptions& options = {}) {
    return ir::compileToIR(fixtures::petSchema(), parseDocument(source), options);
}

const ir::SelectionSet& rootSet(const ir::CompilationContext& context, const std::string& operation) {
    return *context.operations.at(operation).selectionSet;
}

template <typename T>
const T& as(const ir::Selection& selection) {
    return std::get<T>(selection);
}

} // namespace

// ═══════════════════════════════════════════
//  Operation Tests
// ═══════════════════════════════════════════

TEST(CompileToIRTest, OperationMetadata) {
    auto context = compile("query PetQuery($id: ID!) { pet(id: $id) { name } }");
    ASSERT_EQ(context.operations.size(), 1u);
    auto& operation = context.operations.at("PetQuery");
    EXPECT_EQ(operation.operationType, OperationType::Query);
    EXPECT_EQ(operation.rootType, "Query");
    ASSERT_EQ(operation.variables.size(), 1u);
    EXPECT_EQ(operation.variables[0].name, "id");
    EXPECT_EQ(operation.variables[0].type.toString(), "ID!");
    EXPECT_EQ(operation.source, "query PetQuery($id: ID!) {\n  pet(id: $id) {\n    name\n  }\n}");
    EXPECT_EQ(operation.selectionSet->possibleTypes, (std::vector<std::string>{"Query"}));
}

TEST(CompileToIRTest, MutationRoot) {
    auto context = compile("mutation Adopt { adopt(id: 1) { name } }");
    EXPECT_EQ(context.operations.at("Adopt").rootType, "Mutation");
}

TEST(CompileToIRTest, SubscriptionWithoutRootThrows) {
    EXPECT_THROW(compile("subscription S { pet(id: 1) { name } }"), GraphQLError);
}

TEST(CompileToIRTest, AnonymousOperationThrows) {
    EXPECT_THROW(compile("{ owner { name } }"), GraphQLError);
}

TEST(CompileToIRTest, OperationsKeyedByName) {
    auto context = compile("query A { owner { name } } query B { pet(id: 1) { name } }");
    ASSERT_EQ(context.operations.size(), 2u);
    EXPECT_EQ(context.operations.keys(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(context.operations.at("A").operationName, "A");
    EXPECT_EQ(context.operations.at("B").operationName, "B");
    EXPECT_FALSE(context.operations.contains(""));
}

TEST(CompileToIRTest, DuplicateOperationThrows) {
    try {
        compile("query A { owner { name } } query B { owner { name } } query A { owner { name } }");
        FAIL() << "Expected GraphQLError";
    } catch (const GraphQLError& e) {
        EXPECT_NE(std::string(e.what()).find("only one operation named \"A\""), std::string::npos);
    }
}

// ═══════════════════════════════════════════
//  Field Tests
// ═══════════════════════════════════════════

TEST(CompileToIRTest, FieldResolution) {
    auto context = compile(R"(query Q { first: pet(id: "1") { name nickname } })");
    auto& pet = as<ir::Field>(rootSet(context, "Q").selections[0]);
    EXPECT_EQ(pet.responseKey, "first");
    EXPECT_EQ(pet.name, "pet");
    EXPECT_EQ(pet.alias, "first");
    EXPECT_EQ(pet.type.toString(), "Pet");
    ASSERT_EQ(pet.args.size(), 1u);
    EXPECT_EQ(pet.args[0].value, "1");
    EXPECT_EQ(pet.args[0].type->toString(), "ID!");
    ASSERT_TRUE(pet.selectionSet);
    EXPECT_EQ(pet.selectionSet->possibleTypes, (std::vector<std::string>{"Dog", "Cat", "Bird"}));

    auto& nickname = as<ir::Field>(pet.selectionSet->selections[1]);
    EXPECT_TRUE(nickname.isDeprecated);
    EXPECT_EQ(nickname.deprecationReason, "Use name");
    EXPECT_FALSE(nickname.alias.has_value());
}

TEST(CompileToIRTest, VariableArgumentsBecomeVariableObjects) {
    auto context = compile("query Q($id: ID!) { pet(id: $id) { name } }");
    auto& pet = as<ir::Field>(rootSet(context, "Q").selections[0]);
    EXPECT_EQ(pet.args[0].value, (nlohmann::json{{"kind", "Variable"}, {"variableName", "id"}}));
}

TEST(CompileToIRTest, TypenameDescriptionSuppressed) {
    auto context = compile("query Q { owner { __typename name } }");
    auto& owner = as<ir::Field>(rootSet(context, "Q").selections[0]);
    auto& typename_ = as<ir::Field>(owner.selectionSet->selections[0]);
    EXPECT_EQ(typename_.type.toString(), "String!");
    EXPECT_FALSE(typename_.description.has_value());
    EXPECT_EQ(as<ir::Field>(owner.selectionSet->selections[1]).description, "Full name");
}

TEST(CompileToIRTest, UnknownFieldThrows) {
    try {
        compile("query Q { pet(id: 1) { barkVolume } }");
        FAIL() << "Expected GraphQLError";
    } catch (const GraphQLError& e) {
        EXPECT_EQ(e.message(), "Cannot query field \"barkVolume\" on type \"Pet\".");
        EXPECT_TRUE(e.location().has_value());
    }
}

TEST(CompileToIRTest, CompositeFieldWithoutSelectionsThrows) {
    EXPECT_THROW(compile("query Q { owner }"), GraphQLError);
}

TEST(CompileToIRTest, LeafFieldWithSelectionsThrows) {
    EXPECT_THROW(compile("query Q { owner { name { x } } }"), GraphQLError);
}

// ═══════════════════════════════════════════
//  Condition Tests
// ═══════════════════════════════════════════

TEST(CompileToIRTest, InlineFragmentNarrowsPossibleTypes) {
    auto context = compile("query Q { search(text: \"x\") { ... on Pet { name } ... on Person { name } } }");
    auto& search = as<ir::Field>(rootSet(context, "Q").selections[0]);
    auto& onPet = as<ir::TypeCondition>(search.selectionSet->selections[0]);
    EXPECT_EQ(onPet.type, "Pet");
    EXPECT_EQ(onPet.selectionSet->possibleTypes, (std::vector<std::string>{"Dog", "Cat"}));
    auto& onPerson = as<ir::TypeCondition>(search.selectionSet->selections[1]);
    EXPECT_EQ(onPerson.selectionSet->possibleTypes, (std::vector<std::string>{"Person"}));
}

TEST(CompileToIRTest, InlineFragmentWithoutTypeConditionUsesParent) {
    auto context = compile("query Q { pet(id: 1) { ... { name } } }");
    auto& pet = as<ir::Field>(rootSet(context, "Q").selections[0]);
    auto& condition = as<ir::TypeCondition>(pet.selectionSet->selections[0]);
    EXPECT_EQ(condition.type, "Pet");
    EXPECT_EQ(condition.selectionSet->possibleTypes, pet.selectionSet->possibleTypes);
}

TEST(CompileToIRTest, LiteralDirectivesKeepOrDrop) {
    auto context = compile(R"(query Q {
        owner {
            name @include(if: true)
            pets @skip(if: true) { name }
            kept: name @skip(if: false)
            gone: name @include(if: false)
        }
    })");
    auto& owner = as<ir::Field>(rootSet(context, "Q").selections[0]);
    ASSERT_EQ(owner.selectionSet->selections.size(), 2u);
    EXPECT_EQ(as<ir::Field>(owner.selectionSet->selections[0]).responseKey, "name");
    EXPECT_EQ(as<ir::Field>(owner.selectionSet->selections[1]).responseKey, "kept");
}

TEST(CompileToIRTest, VariableDirectivesWrapInBooleanCondition) {
    auto context = compile("query Q($a: Boolean!, $b: Boolean!) { owner { name @include(if: $a) @skip(if: $b) } }");
    auto& owner = as<ir::Field>(rootSet(context, "Q").selections[0]);
    auto& outer = as<ir::BooleanCondition>(owner.selectionSet->selections[0]);
    EXPECT_EQ(outer.variableName, "b");
    EXPECT_TRUE(outer.inverted);
    EXPECT_EQ(outer.selectionSet->possibleTypes, (std::vector<std::string>{"Person"}));
    auto& inner = as<ir::BooleanCondition>(outer.selectionSet->selections[0]);
    EXPECT_EQ(inner.variableName, "a");
    EXPECT_FALSE(inner.inverted);
    EXPECT_EQ(as<ir::Field>(inner.selectionSet->selections[0]).name, "name");
}

// ═══════════════════════════════════════════
//  Fragment Tests
// ═══════════════════════════════════════════

TEST(CompileToIRTest, FragmentSpreadCarriesNarrowedSelections) {
    auto context = compile(R"(
        query Q { search(text: "x") { ...PetName } }
        fragment PetName on Pet { name }
    )");
    auto& search = as<ir::Field>(rootSet(context, "Q").selections[0]);
    auto& spread = as<ir::FragmentSpread>(search.selectionSet->selections[0]);
    EXPECT_EQ(spread.fragmentName, "PetName");
    EXPECT_EQ(spread.typeCondition, "Pet");
    EXPECT_EQ(spread.selectionSet->possibleTypes, (std::vector<std::string>{"Dog", "Cat"}));
    ASSERT_EQ(spread.selectionSet->selections.size(), 1u);

    auto& fragment = context.fragments.at("PetName");
    EXPECT_EQ(fragment.typeCondition, "Pet");
    EXPECT_EQ(fragment.possibleTypes, (std::vector<std::string>{"Dog", "Cat", "Bird"}));
    EXPECT_EQ(fragment.source, "fragment PetName on Pet {\n  name\n}");
}

TEST(CompileToIRTest, FragmentsKeepDeclarationOrder) {
    auto context = compile(R"(
        fragment A on Person { pets { ...B } }
        fragment B on Pet { name }
        query Q { owner { ...A } }
    )");
    EXPECT_EQ(context.fragments.keys(), (std::vector<std::string>{"A", "B"}));
    EXPECT_NE(context.fragmentNamed("B"), nullptr);
    EXPECT_EQ(context.fragmentNamed("C"), nullptr);
}

TEST(CompileToIRTest, UnknownFragmentThrows) {
    EXPECT_THROW(compile("query Q { owner { ...Missing } }"), GraphQLError);
}

TEST(CompileToIRTest, FieldNestingLimit) {
    CompilerOptions options;
    options.maxSelectionDepth = 2;
    EXPECT_NO_THROW(compile("query Q { owner { name ... on Person { name } } }", options));
    try {
        compile("query Q { owner { pets { name } } }", options);
        FAIL() << "Expected GraphQLError";
    } catch (const GraphQLError& e) {
        EXPECT_NE(e.message().find("field \"pets\""), std::string::npos);
    }
}

TEST(CompileToIRTest, FragmentChainLimit) {
    const char* source = R"(
        query Q { owner { ...A } }
        fragment A on Person { ...B }
        fragment B on Person { ...C }
        fragment C on Person { name }
    )";
    CompilerOptions options;
    options.maxSelectionDepth = 2;
    EXPECT_THROW(compile(source, options), GraphQLError);
    options.maxSelectionDepth = 3;
    EXPECT_NO_THROW(compile(source, options));
}

TEST(CompileToIRTest, FragmentCycleThrows) {
    try {
        compile(R"(
            query Q { owner { ...A } }
            fragment A on Person { pets { owner { ...B } } }
            fragment B on Person { ...A }
        )");
        FAIL() << "Expected GraphQLError";
    } catch (const GraphQLError& e) {
        EXPECT_EQ(e.message(), "Cannot spread fragment \"A\" within itself via B.");
    }
}

TEST(CompileToIRTest, DuplicateFragmentThrows) {
    EXPECT_THROW(compile("fragment A on Pet { name } fragment A on Pet { name } query Q { owner { name } }"),
                 GraphQLError);
}

TEST(CompileToIRTest, FragmentOnLeafTypeThrows) {
    EXPECT_THROW(compile("fragment A on Breed { name } query Q { owner { name } }"), GraphQLError);
}

// ═══════════════════════════════════════════
//  typesUsed / addTypename Tests
// ═══════════════════════════════════════════

TEST(CompileToIRTest, TypesUsedInDiscoveryOrder) {
    auto context = compile(R"(
        query Q($filter: PetFilter, $since: Date) {
            pets(filter: $filter) { ... on Dog { breed } }
            adoptedOn: owner { name }
        }
    )");
    EXPECT_EQ(context.typesUsed, (std::vector<std::string>{"PetFilter", "Breed", "DateRange", "Date"}));
}

TEST(CompileToIRTest, AddTypenameOption) {
    CompilerOptions options;
    options.addTypename = true;
    auto context = compile("query Q { owner { name } }", options);
    auto& owner = as<ir::Field>(rootSet(context, "Q").selections[0]);
    ASSERT_EQ(owner.selectionSet->selections.size(), 2u);
    EXPECT_EQ(as<ir::Field>(owner.selectionSet->selections[0]).name, "__typename");
    EXPECT_EQ(rootSet(context, "Q").selections.size(), 1u);
    EXPECT_NE(context.operations.at("Q").source.find("__typename"), std::string::npos);
}

TEST(CompileToIRTest, NestedSelectionSetAccessor) {
    auto context = compile("query Q { owner { name } }");
    auto& owner = rootSet(context, "Q").selections[0];
    ASSERT_NE(ir::nestedSelectionSet(owner), nullptr);
    EXPECT_EQ(ir::nestedSelectionSet(std::get<ir::Field>(owner).selectionSet->selections[0]), nullptr);
}

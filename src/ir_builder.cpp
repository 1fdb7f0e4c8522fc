// ═══════════════════════════════════════════════════════════════════
//  src/ir_builder.cpp — Typed IR from a schema and a parsed document
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/ir.h"
#include "gqlir/printer.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace gqlir::ir {

const SelectionSet* nestedSelectionSet(const Selection& selection) {
    return std::visit([](const auto& s) -> const SelectionSet* { return s.selectionSet.get(); },
                      selection);
}

namespace {

class IRBuilder {
public:
    IRBuilder(std::shared_ptr<const Schema> schema, const ast::Document& document,
              const CompilerOptions& options)
        : schema_(std::move(schema)),
          document_(options.addTypename ? ast::addTypenameFields(document) : document) {
        context_.schema = schema_;
        context_.options = options;
    }

    CompilationContext build() {
        for (auto& fragment : document_.fragments) {
            if (!fragmentDefinitions_.emplace(fragment.name, &fragment).second) {
                throw GraphQLError("There can be only one fragment named \"" + fragment.name + "\".",
                                   fragment.location);
            }
        }

        for (auto& fragment : document_.fragments) {
            compileFragment(fragment.name, fragment.location);
        }
        for (auto& fragment : document_.fragments) {
            context_.fragments.insert(fragment.name, compiledFragments_.at(fragment.name));
        }

        for (auto& operation : document_.operations) {
            compileOperation(operation);
        }
        return std::move(context_);
    }

private:
    std::shared_ptr<const Schema> schema_;
    ast::Document document_;
    CompilationContext context_;

    std::unordered_map<std::string, const ast::FragmentDefinition*> fragmentDefinitions_;
    std::unordered_map<std::string, Fragment> compiledFragments_;
    std::vector<std::string> fragmentStack_;
    std::unordered_set<std::string> typesUsedSet_;

    const NamedType& lookupType(const std::string& name, const SourceLocation& where) const {
        auto* type = schema_->type(name);
        if (!type) throw GraphQLError("Unknown type \"" + name + "\".", where);
        return *type;
    }

    void addTypeUsed(const std::string& name) {
        if (typesUsedSet_.count(name)) return;
        auto* type = schema_->type(name);
        if (!type) return;

        bool used = type->kind == TypeKind::Enum || type->kind == TypeKind::InputObject ||
                    (type->kind == TypeKind::Scalar && !Schema::isBuiltInScalar(type->name));
        if (!used) return;

        typesUsedSet_.insert(name);
        context_.typesUsed.push_back(name);
        if (type->kind == TypeKind::InputObject) {
            for (auto& field : type->inputFields) addTypeUsed(field.type.namedType());
        }
    }

    void compileOperation(const ast::OperationDefinition& definition) {
        if (definition.name.empty()) {
            throw GraphQLError("Anonymous operations are not supported; every operation must be named.",
                               definition.location);
        }
        if (context_.operations.contains(definition.name)) {
            throw GraphQLError("There can be only one operation named \"" + definition.name + "\".",
                               definition.location);
        }

        auto* rootType = schema_->rootType(definition.operation);
        if (!rootType) {
            throw GraphQLError(std::string("Schema is not configured for ") +
                               toString(definition.operation) + " operations.",
                               definition.location);
        }

        Operation operation;
        operation.filePath = definition.filePath;
        operation.operationName = definition.name;
        operation.operationType = definition.operation;
        operation.rootType = rootType->name;
        for (auto& variable : definition.variables) {
            auto& type = lookupType(variable.type.namedType(), definition.location);
            if (!type.isInput()) {
                throw GraphQLError("Variable \"$" + variable.name + "\" cannot be non-input type \"" +
                                   variable.type.toString() + "\".", definition.location);
            }
            addTypeUsed(type.name);
            operation.variables.push_back({variable.name, variable.type});
        }
        operation.source = print(definition);
        operation.selectionSet = compileSelectionSet(definition.selectionSet, *rootType,
                                                     schema_->possibleTypes(rootType->name), 1);
        auto name = operation.operationName;
        context_.operations.insert(name, std::move(operation));
    }

    const Fragment& compileFragment(const std::string& name, const SourceLocation& where) {
        if (auto it = compiledFragments_.find(name); it != compiledFragments_.end()) {
            return it->second;
        }
        auto def = fragmentDefinitions_.find(name);
        if (def == fragmentDefinitions_.end()) {
            throw GraphQLError("Unknown fragment \"" + name + "\".", where);
        }

        auto cycleStart = std::find(fragmentStack_.begin(), fragmentStack_.end(), name);
        if (cycleStart != fragmentStack_.end()) {
            std::string via;
            for (auto it = cycleStart + 1; it != fragmentStack_.end(); ++it) {
                via += (via.empty() ? "" : ", ") + *it;
            }
            throw GraphQLError("Cannot spread fragment \"" + name + "\" within itself" +
                               (via.empty() ? "" : " via " + via) + ".", where);
        }

        const auto& definition = *def->second;
        if (fragmentStack_.size() >= context_.options.maxSelectionDepth) {
            throw GraphQLError("Fragment spreads nested deeper than " +
                               std::to_string(context_.options.maxSelectionDepth) +
                               " levels at fragment \"" + name + "\".", where);
        }
        auto& type = lookupType(definition.typeCondition, definition.location);
        if (!type.isComposite()) {
            throw GraphQLError("Fragment \"" + name + "\" cannot condition on non composite type \"" +
                               type.name + "\".", definition.location);
        }

        fragmentStack_.push_back(name);
        Fragment fragment;
        fragment.filePath = definition.filePath;
        fragment.fragmentName = name;
        fragment.source = print(definition);
        fragment.typeCondition = type.name;
        fragment.possibleTypes = schema_->possibleTypes(type.name);
        fragment.selectionSet = compileSelectionSet(definition.selectionSet, type, fragment.possibleTypes, 1);
        fragmentStack_.pop_back();

        return compiledFragments_.emplace(name, std::move(fragment)).first->second;
    }

    // `depth` counts field selection sets from the root, which is 1;
    // inline fragments stay at the depth of their parent.
    SelectionSetPtr compileSelectionSet(const std::vector<ast::Selection>& selections,
                                        const NamedType& parentType,
                                        std::vector<std::string> possibleTypes,
                                        std::size_t depth) {
        auto selectionSet = std::make_shared<SelectionSet>();
        selectionSet->possibleTypes = std::move(possibleTypes);
        for (auto& node : selections) {
            if (auto selection = compileSelection(node, parentType, selectionSet->possibleTypes, depth)) {
                selectionSet->selections.push_back(std::move(*selection));
            }
        }
        return selectionSet;
    }

    std::optional<Selection> compileSelection(const ast::Selection& node,
                                              const NamedType& parentType,
                                              const std::vector<std::string>& possibleTypes,
                                              std::size_t depth) {
        switch (node.kind) {
            case ast::Selection::Kind::Field:
                return wrapInBooleanConditions(compileField(node, parentType, depth), node, possibleTypes);

            case ast::Selection::Kind::InlineFragment: {
                const NamedType& type = node.typeCondition
                    ? lookupType(*node.typeCondition, node.location)
                    : parentType;
                if (!type.isComposite()) {
                    throw GraphQLError("Fragment cannot condition on non composite type \"" +
                                       type.name + "\".", node.location);
                }
                TypeCondition condition;
                condition.type = type.name;
                condition.selectionSet = compileSelectionSet(
                    node.selectionSet, type, intersectTypes(schema_->possibleTypes(type.name), possibleTypes),
                    depth);
                return wrapInBooleanConditions(std::move(condition), node, possibleTypes);
            }

            case ast::Selection::Kind::FragmentSpread: {
                const auto& fragment = compileFragment(node.name, node.location);
                auto selectionSet = std::make_shared<SelectionSet>();
                selectionSet->possibleTypes = intersectTypes(possibleTypes, fragment.possibleTypes);
                selectionSet->selections = fragment.selectionSet->selections;

                FragmentSpread spread;
                spread.fragmentName = fragment.fragmentName;
                spread.typeCondition = fragment.typeCondition;
                spread.selectionSet = std::move(selectionSet);
                return wrapInBooleanConditions(std::move(spread), node, possibleTypes);
            }
        }
        return std::nullopt;
    }

    Field compileField(const ast::Selection& node, const NamedType& parentType, std::size_t depth) {
        auto* definition = schema_->fieldDefinition(parentType, node.name);
        if (!definition) {
            throw GraphQLError("Cannot query field \"" + node.name + "\" on type \"" +
                               parentType.name + "\".", node.location);
        }
        auto& namedType = lookupType(definition->type.namedType(), node.location);
        addTypeUsed(namedType.name);

        Field field;
        field.responseKey = node.responseKey();
        field.name = node.name;
        if (!node.alias.empty()) field.alias = node.alias;
        for (auto& arg : node.arguments) {
            Argument argument;
            argument.name = arg.name;
            argument.value = ast::valueToJson(arg.value);
            for (auto& argDef : definition->args) {
                if (argDef.name == arg.name) argument.type = argDef.type;
            }
            field.args.push_back(std::move(argument));
        }
        field.type = definition->type;
        if (node.name.rfind("__", 0) != 0) field.description = definition->description;
        field.isDeprecated = definition->isDeprecated;
        field.deprecationReason = definition->deprecationReason;

        if (namedType.isComposite()) {
            if (node.selectionSet.empty()) {
                throw GraphQLError("Field \"" + node.name + "\" of type \"" + definition->type.toString() +
                                   "\" must have a selection of subfields.", node.location);
            }
            if (depth >= context_.options.maxSelectionDepth) {
                throw GraphQLError("Selection sets nested deeper than " +
                                   std::to_string(context_.options.maxSelectionDepth) +
                                   " levels at field \"" + field.responseKey + "\".", node.location);
            }
            field.selectionSet = compileSelectionSet(node.selectionSet, namedType,
                                                     schema_->possibleTypes(namedType.name), depth + 1);
        } else if (!node.selectionSet.empty()) {
            throw GraphQLError("Field \"" + node.name + "\" must not have a selection since type \"" +
                               definition->type.toString() + "\" has no subfields.", node.location);
        }
        return field;
    }

    // @include/@skip with a literal keep or drop the selection; with a
    // variable they wrap it in a BooleanCondition, innermost first.
    std::optional<Selection> wrapInBooleanConditions(Selection selection,
                                                     const ast::Selection& node,
                                                     const std::vector<std::string>& possibleTypes) {
        for (auto& directive : node.directives) {
            if (directive.name != "include" && directive.name != "skip") continue;
            bool isSkip = directive.name == "skip";

            auto arg = std::find_if(directive.arguments.begin(), directive.arguments.end(),
                                    [](const ast::Argument& a) { return a.name == "if"; });
            if (arg == directive.arguments.end()) {
                throw GraphQLError("Directive \"@" + directive.name +
                                   "\" argument \"if\" of type \"Boolean!\" is required.",
                                   directive.location);
            }

            switch (arg->value.kind) {
                case ast::Value::Kind::Boolean:
                    if (arg->value.boolean == isSkip) return std::nullopt;
                    break;
                case ast::Value::Kind::Variable: {
                    auto wrapper = std::make_shared<SelectionSet>();
                    wrapper->possibleTypes = possibleTypes;
                    wrapper->selections.push_back(std::move(selection));
                    BooleanCondition condition;
                    condition.variableName = arg->value.text;
                    condition.inverted = isSkip;
                    condition.selectionSet = std::move(wrapper);
                    selection = std::move(condition);
                    break;
                }
                default:
                    throw GraphQLError("Argument \"if\" of \"@" + directive.name +
                                       "\" must be a Boolean literal or a variable.",
                                       directive.location);
            }
        }
        return selection;
    }
};

} // namespace

CompilationContext compileToIR(std::shared_ptr<const Schema> schema,
                               const ast::Document& document,
                               const CompilerOptions& options) {
    IRBuilder builder(std::move(schema), document, options);
    return builder.build();
}

} // namespace gqlir::ir

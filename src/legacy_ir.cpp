// ═══════════════════════════════════════════════════════════════════
//  src/legacy_ir.cpp — Lowering typed IR into the legacy IR
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/legacy_ir.h"
#include "gqlir/console.h"
#include "gqlir/crypto.h"
#include "gqlir/errors.h"

#include <chrono>

namespace gqlir::legacy {

// ═══════════════════════════════════════════
//  Fragment-spread classifier
// ═══════════════════════════════════════════

namespace {

void classifyInto(const ir::SelectionSet& selectionSet,
                  const std::vector<std::string>& possibleTypes,
                  std::vector<std::string>& spreads) {
    for (auto& selection : selectionSet.selections) {
        std::visit(ir::Overload{
            [](const ir::Field&) {},
            [&](const ir::FragmentSpread& spread) {
                spreads.push_back(spread.fragmentName);
            },
            [&](const ir::TypeCondition& condition) {
                if (!condition.selectionSet) {
                    throw CompilationError("Malformed IR: type condition on " + condition.type +
                                           " has no selection set");
                }
                if (ir::coversAll(condition.selectionSet->possibleTypes, possibleTypes)) {
                    classifyInto(*condition.selectionSet, possibleTypes, spreads);
                }
            },
            [&](const ir::BooleanCondition& condition) {
                if (!condition.selectionSet) {
                    throw CompilationError("Malformed IR: condition on $" + condition.variableName +
                                           " has no selection set");
                }
                classifyInto(*condition.selectionSet, possibleTypes, spreads);
            }
        }, selection);
    }
}

} // namespace

std::vector<std::string> collectFragmentSpreads(const ir::SelectionSet& selectionSet) {
    return collectFragmentSpreads(selectionSet, selectionSet.possibleTypes);
}

std::vector<std::string> collectFragmentSpreads(const ir::SelectionSet& selectionSet,
                                                const std::vector<std::string>& possibleTypes) {
    std::vector<std::string> spreads;
    classifyInto(selectionSet, possibleTypes, spreads);
    return spreads;
}

Collaborators Collaborators::defaults() {
    return Collaborators{
        std::make_shared<TypeCaseBuilder>(),
        std::make_shared<FragmentClosureCollector>(),
        std::make_shared<FragmentSpreadInliner>()
    };
}

// ═══════════════════════════════════════════
//  SelectionSetLowerer
// ═══════════════════════════════════════════

TypeCase SelectionSetLowerer::typeCaseFor(const ir::SelectionSet& selectionSet) const {
    if (options_.mergeInFieldsFromFragmentSpreads) {
        auto merged = spreadMerger_.merge(selectionSet);
        return partitioner_.partition(*merged);
    }
    return partitioner_.partition(selectionSet);
}

SelectionSetBody SelectionSetLowerer::lowerSelectionSet(const ir::SelectionSet& selectionSet) const {
    return lower(selectionSet, typeCaseFor(selectionSet), 1);
}

SelectionSetBody SelectionSetLowerer::lowerSelectionSet(const ir::SelectionSet& selectionSet,
                                                        const TypeCase& typeCase) const {
    return lower(selectionSet, typeCase, 1);
}

Field SelectionSetLowerer::lowerField(const ir::Field& field) const {
    return lowerField(field, 1);
}

SelectionSetBody SelectionSetLowerer::lower(const ir::SelectionSet& selectionSet,
                                            const TypeCase& typeCase,
                                            std::size_t depth) const {
    SelectionSetBody body;
    for (auto& field : typeCase.defaultRecord.fields) {
        body.fields.push_back(lowerField(field, depth));
    }

    for (auto& record : typeCase.records) {
        // Records that narrow nothing or select nothing add no code
        if (ir::coversAll(record.possibleTypes, selectionSet.possibleTypes)) continue;
        if (record.fieldCount() == 0) continue;

        std::vector<Field> fields;
        fields.reserve(record.fields.size());
        for (auto& field : record.fields) fields.push_back(lowerField(field, depth));
        auto spreads = collectFragmentSpreads(selectionSet, record.possibleTypes);

        for (auto& type : record.possibleTypes) {
            body.inlineFragments.push_back(InlineFragment{type, {type}, fields, spreads});
        }
    }

    body.fragmentSpreads = collectFragmentSpreads(selectionSet);
    return body;
}

Field SelectionSetLowerer::lowerField(const ir::Field& field, std::size_t depth) const {
    Field result;
    result.responseName = field.responseKey;
    result.fieldName = field.name;
    result.type = field.type;
    result.args = field.args;
    result.isConditional = field.isConditional;
    result.description = field.description;
    result.isDeprecated = field.isDeprecated;
    result.deprecationReason = field.deprecationReason;

    if (field.selectionSet) {
        if (depth >= options_.maxSelectionDepth) {
            throw CompilationError("Selection sets nested deeper than " +
                                   std::to_string(options_.maxSelectionDepth) +
                                   " levels at field \"" + field.responseKey + "\"");
        }
        auto body = lower(*field.selectionSet, typeCaseFor(*field.selectionSet), depth + 1);
        result.hasSelectionSet = true;
        result.fields = std::move(body.fields);
        result.fragmentSpreads = std::move(body.fragmentSpreads);
        result.inlineFragments = std::move(body.inlineFragments);
    }
    return result;
}

// ═══════════════════════════════════════════
//  Operation / fragment assembly
// ═══════════════════════════════════════════

namespace {

const ir::SelectionSet& rootSelectionSet(const ir::SelectionSetPtr& selectionSet,
                                         const std::string& kind, const std::string& name) {
    if (!selectionSet) {
        throw CompilationError("Malformed IR: " + kind + " \"" + name + "\" has no selection set");
    }
    return *selectionSet;
}

CompiledOperation compileOperation(const ir::CompilationContext& context,
                                   const ir::Operation& operation,
                                   const SelectionSetLowerer& lowerer,
                                   const FragmentReferenceCollector& referenceCollector) {
    auto& selectionSet = rootSelectionSet(operation.selectionSet, "operation", operation.operationName);

    CompiledOperation compiled;
    compiled.filePath = operation.filePath;
    compiled.operationName = operation.operationName;
    compiled.operationType = operation.operationType;
    compiled.rootType = operation.rootType;
    compiled.variables = operation.variables;
    compiled.source = operation.source;
    compiled.fragmentsReferenced = referenceCollector.collect(selectionSet);

    compiled.sourceWithFragments = operation.source;
    for (auto& name : compiled.fragmentsReferenced) {
        auto* fragment = context.fragmentNamed(name);
        if (!fragment) {
            throw CompilationError("Cannot find fragment \"" + name + "\" referenced by operation \"" +
                                   operation.operationName + "\"");
        }
        compiled.sourceWithFragments += "\n" + fragment->source;
    }
    if (context.options.generateOperationIds) {
        compiled.operationId = crypto::operationId(compiled.sourceWithFragments);
    }

    auto body = lowerer.lowerSelectionSet(selectionSet);
    compiled.fields = std::move(body.fields);
    compiled.fragmentSpreads = std::move(body.fragmentSpreads);
    compiled.inlineFragments = std::move(body.inlineFragments);
    return compiled;
}

CompiledFragment compileFragment(const ir::Fragment& fragment, const SelectionSetLowerer& lowerer) {
    auto& selectionSet = rootSelectionSet(fragment.selectionSet, "fragment", fragment.fragmentName);

    CompiledFragment compiled;
    compiled.filePath = fragment.filePath;
    compiled.fragmentName = fragment.fragmentName;
    compiled.source = fragment.source;
    compiled.typeCondition = fragment.typeCondition;
    compiled.possibleTypes = fragment.possibleTypes;

    auto body = lowerer.lowerSelectionSet(selectionSet);
    compiled.fields = std::move(body.fields);
    compiled.fragmentSpreads = std::move(body.fragmentSpreads);
    compiled.inlineFragments = std::move(body.inlineFragments);
    return compiled;
}

} // namespace

LegacyCompilationContext compileToLegacyIR(const ir::CompilationContext& context,
                                           const Collaborators& collaborators) {
    if (!collaborators.partitioner || !collaborators.referenceCollector || !collaborators.spreadMerger) {
        throw CompilationError("compileToLegacyIR requires a partitioner, reference collector and spread merger");
    }

    auto start = std::chrono::steady_clock::now();

    LegacyCompilationContext result;
    result.schema = context.schema;
    result.typesUsed = context.typesUsed;
    result.options = context.options;

    SelectionSetLowerer lowerer(*collaborators.partitioner, *collaborators.spreadMerger, result.options);

    for (auto& [name, operation] : context.operations) {
        auto compiled = compileOperation(context, operation, lowerer, *collaborators.referenceCollector);
        console::debug("Compiled operation", name, "with", compiled.fragmentsReferenced.size(),
                       "referenced fragments", compiled.operationId.value_or(""));
        result.operations.insert(name, std::move(compiled));
    }
    for (auto& [name, fragment] : context.fragments) {
        result.fragments.insert(name, compileFragment(fragment, lowerer));
    }

    if (console::enabled(console::Level::Debug)) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        console::debug("Lowered", result.operations.size(), "operations and",
                       result.fragments.size(), "fragments in",
                       std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0,
                       "ms");
    }
    return result;
}

LegacyCompilationContext compileToLegacyIR(std::shared_ptr<const Schema> schema,
                                           const ast::Document& document,
                                           const CompilerOptions& options) {
    return compileToLegacyIR(ir::compileToIR(std::move(schema), document, options));
}

} // namespace gqlir::legacy

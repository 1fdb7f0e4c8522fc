#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/legacy_ir.h — Flattened IR consumed by code generators
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto schema = buildSchema(sdl);
//    auto document = parseDocument(source, "Queries.graphql");
//    CompilerOptions options;
//    options.generateOperationIds = true;
//    auto context = legacy::compileToLegacyIR(schema, document, options);
//
//    for (auto& [name, operation] : context.operations) {
//        console::log(name, *operation.operationId);
//    }
//
//  Every selection set is lowered into three lists:
//
//    fields           — fields selected for every possible type
//    fragmentSpreads  — named fragments visible at this level
//    inlineFragments  — one entry per concrete type that selects more
//
// ═══════════════════════════════════════════════════════════════════

#include "fragments.h"
#include "ir.h"
#include "options.h"
#include "ordered_map.h"
#include "schema.h"
#include "type_case.h"
#include "type_ref.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gqlir::legacy {

struct InlineFragment;

struct Field {
    std::string responseName;
    std::string fieldName;
    TypeRef type;
    std::vector<ir::Argument> args;
    bool isConditional = false;
    std::optional<std::string> description;
    bool isDeprecated = false;
    std::optional<std::string> deprecationReason;

    // The lists below are only meaningful when hasSelectionSet is set.
    bool hasSelectionSet = false;
    std::vector<Field> fields;
    std::vector<std::string> fragmentSpreads;
    std::vector<InlineFragment> inlineFragments;
};

struct InlineFragment {
    // Always a single concrete type, also the only possible type
    std::string typeCondition;
    std::vector<std::string> possibleTypes;
    std::vector<Field> fields;
    std::vector<std::string> fragmentSpreads;
};

struct SelectionSetBody {
    std::vector<Field> fields;
    std::vector<std::string> fragmentSpreads;
    std::vector<InlineFragment> inlineFragments;
};

struct CompiledOperation {
    std::optional<std::string> filePath;
    std::string operationName;
    OperationType operationType = OperationType::Query;
    std::string rootType;
    std::vector<ir::Variable> variables;
    std::string source;
    std::vector<Field> fields;
    std::vector<std::string> fragmentSpreads;
    std::vector<InlineFragment> inlineFragments;
    std::vector<std::string> fragmentsReferenced;
    std::string sourceWithFragments;
    std::optional<std::string> operationId;
};

struct CompiledFragment {
    std::optional<std::string> filePath;
    std::string fragmentName;
    std::string source;
    std::string typeCondition;
    std::vector<std::string> possibleTypes;
    std::vector<Field> fields;
    std::vector<std::string> fragmentSpreads;
    std::vector<InlineFragment> inlineFragments;
};

struct LegacyCompilationContext {
    std::shared_ptr<const Schema> schema;
    OrderedMap<CompiledOperation> operations;
    OrderedMap<CompiledFragment> fragments;
    std::vector<std::string> typesUsed;
    CompilerOptions options;
};

// ═══════════════════════════════════════════
//  collectFragmentSpreads
//  Spreads visible at the level of `selectionSet` when the runtime type
//  is one of `possibleTypes` (default: all of the set's possible types).
//  Type conditions are entered only when they cover every type in
//  `possibleTypes`; boolean conditions are always entered. Nested field
//  selection sets are not visited. Repeated spreads are kept.
// ═══════════════════════════════════════════
std::vector<std::string> collectFragmentSpreads(const ir::SelectionSet& selectionSet);
std::vector<std::string> collectFragmentSpreads(const ir::SelectionSet& selectionSet,
                                                const std::vector<std::string>& possibleTypes);

// ── Pluggable steps of the lowering; defaults() wires the built-ins ──
struct Collaborators {
    std::shared_ptr<const TypeCasePartitioner> partitioner;
    std::shared_ptr<const FragmentReferenceCollector> referenceCollector;
    std::shared_ptr<const FragmentSpreadMerger> spreadMerger;

    static Collaborators defaults();
};

// ═══════════════════════════════════════════
//  SelectionSetLowerer
//  Lowers selection sets and fields, re-entering the partitioner for
//  every nested field selection set. Throws CompilationError when
//  nesting exceeds options.maxSelectionDepth.
// ═══════════════════════════════════════════
class SelectionSetLowerer {
public:
    SelectionSetLowerer(const TypeCasePartitioner& partitioner,
                        const FragmentSpreadMerger& spreadMerger,
                        const CompilerOptions& options)
        : partitioner_(partitioner), spreadMerger_(spreadMerger), options_(options) {}

    // Partitions `selectionSet` (after merging spreads when enabled)
    // and lowers it.
    SelectionSetBody lowerSelectionSet(const ir::SelectionSet& selectionSet) const;
    SelectionSetBody lowerSelectionSet(const ir::SelectionSet& selectionSet,
                                       const TypeCase& typeCase) const;
    Field lowerField(const ir::Field& field) const;

    TypeCase typeCaseFor(const ir::SelectionSet& selectionSet) const;

private:
    const TypeCasePartitioner& partitioner_;
    const FragmentSpreadMerger& spreadMerger_;
    const CompilerOptions& options_;

    SelectionSetBody lower(const ir::SelectionSet& selectionSet, const TypeCase& typeCase,
                           std::size_t depth) const;
    Field lowerField(const ir::Field& field, std::size_t depth) const;
};

// ═══════════════════════════════════════════
//  compileToLegacyIR
//  Lowers every operation and fragment of `context`. Operations also
//  get their fragment closure, sourceWithFragments and, when
//  options.generateOperationIds is set, a SHA-256 operationId. Throws
//  CompilationError if the closure names an undefined fragment.
// ═══════════════════════════════════════════
LegacyCompilationContext compileToLegacyIR(const ir::CompilationContext& context,
                                           const Collaborators& collaborators = Collaborators::defaults());

// Runs compileToIR first.
LegacyCompilationContext compileToLegacyIR(std::shared_ptr<const Schema> schema,
                                           const ast::Document& document,
                                           const CompilerOptions& options = {});

} // namespace gqlir::legacy

// ═══════════════════════════════════════════════════════════════════
//  src/fragments.cpp — Fragment closure and spread inlining
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/fragments.h"

#include <memory>
#include <unordered_set>

namespace gqlir {

namespace {

void collectInto(const ir::SelectionSet& selectionSet,
                 std::vector<std::string>& names,
                 std::unordered_set<std::string>& seen) {
    for (auto& selection : selectionSet.selections) {
        if (auto* spread = std::get_if<ir::FragmentSpread>(&selection)) {
            if (!seen.insert(spread->fragmentName).second) continue;
            names.push_back(spread->fragmentName);
        }
        if (auto* nested = ir::nestedSelectionSet(selection)) {
            collectInto(*nested, names, seen);
        }
    }
}

} // namespace

std::vector<std::string> FragmentClosureCollector::collect(const ir::SelectionSet& selectionSet) const {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    collectInto(selectionSet, names, seen);
    return names;
}

ir::SelectionSetPtr FragmentSpreadInliner::merge(const ir::SelectionSet& selectionSet) const {
    auto merged = std::make_shared<ir::SelectionSet>();
    merged->possibleTypes = selectionSet.possibleTypes;
    merged->selections.reserve(selectionSet.selections.size());

    auto mergeNested = [this](const ir::SelectionSetPtr& nested) -> ir::SelectionSetPtr {
        return nested ? merge(*nested) : nullptr;
    };

    for (auto& selection : selectionSet.selections) {
        merged->selections.push_back(std::visit(ir::Overload{
            [](const ir::Field& field) -> ir::Selection { return field; },
            [&](const ir::TypeCondition& condition) -> ir::Selection {
                return ir::TypeCondition{condition.type, mergeNested(condition.selectionSet)};
            },
            [&](const ir::BooleanCondition& condition) -> ir::Selection {
                return ir::BooleanCondition{condition.variableName, condition.inverted,
                                            mergeNested(condition.selectionSet)};
            },
            [&](const ir::FragmentSpread& spread) -> ir::Selection {
                return ir::TypeCondition{spread.typeCondition, mergeNested(spread.selectionSet)};
            }
        }, selection));
    }
    return merged;
}

} // namespace gqlir

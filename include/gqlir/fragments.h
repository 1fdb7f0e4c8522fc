#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/fragments.h — Fragment closure and spread inlining
// ═══════════════════════════════════════════════════════════════════

#include "ir.h"
#include <string>
#include <vector>

namespace gqlir {

// ── Names of all fragments reachable from a selection set ──
class FragmentReferenceCollector {
public:
    virtual ~FragmentReferenceCollector() = default;
    virtual std::vector<std::string> collect(const ir::SelectionSet& selectionSet) const = 0;
};

// ── Folds the selections of spread fragments into a selection set ──
class FragmentSpreadMerger {
public:
    virtual ~FragmentSpreadMerger() = default;
    virtual ir::SelectionSetPtr merge(const ir::SelectionSet& selectionSet) const = 0;
};

// Pre-order walk through every nesting level. Each fragment is listed
// on its first occurrence and its selections are visited once. The
// input must be free of fragment cycles, which compileToIR guarantees.
class FragmentClosureCollector : public FragmentReferenceCollector {
public:
    std::vector<std::string> collect(const ir::SelectionSet& selectionSet) const override;
};

// Replaces each spread with a type condition on the fragment's type
// over the fragment's selections, recursing through type and boolean
// conditions. Field selection sets are left untouched; they are merged
// when the field itself is lowered.
class FragmentSpreadInliner : public FragmentSpreadMerger {
public:
    ir::SelectionSetPtr merge(const ir::SelectionSet& selectionSet) const override;
};

} // namespace gqlir

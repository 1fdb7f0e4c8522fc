#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/type_case.h — Partitioning a selection set by possible type
// ═══════════════════════════════════════════════════════════════════
//
//  For `pet { name ... on Dog { barkVolume } }` with possible types
//  {Dog, Cat} the type case is
//
//    default:  {Dog, Cat}  [name]
//    records:  {Dog}       [name, barkVolume]
//
//  The default record holds the fields selected for every possible
//  type; each extra record holds every field that applies when the
//  runtime type is in its subset, the default fields included.
//
// ═══════════════════════════════════════════════════════════════════

#include "ir.h"
#include <cstddef>
#include <string>
#include <vector>

namespace gqlir {

struct TypeCaseRecord {
    std::vector<std::string> possibleTypes;
    std::vector<ir::Field> fields;

    std::size_t fieldCount() const { return fields.size(); }
};

struct TypeCase {
    TypeCaseRecord defaultRecord;
    std::vector<TypeCaseRecord> records;
};

// ── Seam for the lowerer; tests substitute fixed partitions ──
class TypeCasePartitioner {
public:
    virtual ~TypeCasePartitioner() = default;
    virtual TypeCase partition(const ir::SelectionSet& selectionSet) const = 0;
};

// ═══════════════════════════════════════════
//  TypeCaseBuilder
//  Extra records have disjoint possible-type subsets and are kept in
//  creation order. A new record starts with the default record's
//  fields, and fields later selected for every possible type are added
//  to it as well. A record is split when a later type condition covers
//  only part of it; both parts keep its fields. Every narrower type
//  condition registers its
//  subset even when it selects no fields. Fields with the same response
//  key are merged; a merged field is conditional only if every
//  occurrence is. Fragment spreads are not descended into.
// ═══════════════════════════════════════════
class TypeCaseBuilder : public TypeCasePartitioner {
public:
    TypeCase partition(const ir::SelectionSet& selectionSet) const override;
};

} // namespace gqlir

// ═══════════════════════════════════════════════════════════════════
//  src/type_case.cpp — Default type-case partitioner
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/type_case.h"
#include "gqlir/errors.h"

#include <memory>

namespace gqlir {

namespace {

void mergeField(std::vector<ir::Field>& fields, const ir::Field& field) {
    for (auto& existing : fields) {
        if (existing.responseKey != field.responseKey) continue;

        existing.isConditional = existing.isConditional && field.isConditional;
        if (field.selectionSet) {
            if (!existing.selectionSet) {
                existing.selectionSet = field.selectionSet;
            } else {
                auto merged = std::make_shared<ir::SelectionSet>(*existing.selectionSet);
                merged->selections.insert(merged->selections.end(),
                                          field.selectionSet->selections.begin(),
                                          field.selectionSet->selections.end());
                existing.selectionSet = std::move(merged);
            }
        }
        return;
    }
    fields.push_back(field);
}

class Partition {
public:
    explicit Partition(std::vector<std::string> possibleTypes) {
        typeCase_.defaultRecord.possibleTypes = std::move(possibleTypes);
    }

    void walk(const ir::SelectionSet& selectionSet,
              const std::vector<std::string>& possibleTypes, bool isConditional) {
        for (auto& selection : selectionSet.selections) {
            std::visit(ir::Overload{
                [&](const ir::Field& field) {
                    ir::Field copy = field;
                    copy.isConditional = field.isConditional || isConditional;
                    addField(possibleTypes, copy);
                },
                [&](const ir::TypeCondition& condition) {
                    auto& nested = requireSelectionSet(condition.selectionSet, "type condition on " + condition.type);
                    auto narrowed = ir::intersectTypes(nested.possibleTypes, possibleTypes);
                    if (narrowed.empty()) return;
                    registerSubset(narrowed);
                    walk(nested, narrowed, isConditional);
                },
                [&](const ir::BooleanCondition& condition) {
                    walk(requireSelectionSet(condition.selectionSet, "condition on $" + condition.variableName),
                         possibleTypes, true);
                },
                [](const ir::FragmentSpread&) {}
            }, selection);
        }
    }

    TypeCase take() { return std::move(typeCase_); }

private:
    TypeCase typeCase_;

    static const ir::SelectionSet& requireSelectionSet(const ir::SelectionSetPtr& selectionSet,
                                                       const std::string& what) {
        if (!selectionSet) {
            throw CompilationError("Malformed IR: " + what + " has no selection set");
        }
        return *selectionSet;
    }

    bool isDefault(const std::vector<std::string>& possibleTypes) const {
        return ir::coversAll(possibleTypes, typeCase_.defaultRecord.possibleTypes);
    }

    void registerSubset(std::vector<std::string> subset) {
        if (isDefault(subset)) return;

        auto& records = typeCase_.records;
        for (std::size_t i = 0; i < records.size() && !subset.empty(); i++) {
            auto inside = ir::intersectTypes(records[i].possibleTypes, subset);
            if (inside.empty()) continue;

            if (inside.size() != records[i].possibleTypes.size()) {
                TypeCaseRecord outside{{}, records[i].fields};
                for (auto& type : records[i].possibleTypes) {
                    if (!ir::coversAll(inside, {type})) outside.possibleTypes.push_back(type);
                }
                records[i].possibleTypes = inside;
                records.insert(records.begin() + static_cast<std::ptrdiff_t>(i) + 1, std::move(outside));
            }

            std::vector<std::string> remaining;
            for (auto& type : subset) {
                if (!ir::coversAll(inside, {type})) remaining.push_back(type);
            }
            subset = std::move(remaining);
        }

        // Types still owned by the default record start from its fields
        if (!subset.empty()) records.push_back({std::move(subset), typeCase_.defaultRecord.fields});
    }

    void addField(const std::vector<std::string>& possibleTypes, const ir::Field& field) {
        if (isDefault(possibleTypes)) {
            mergeField(typeCase_.defaultRecord.fields, field);
            for (auto& record : typeCase_.records) mergeField(record.fields, field);
            return;
        }
        registerSubset(possibleTypes);
        for (auto& record : typeCase_.records) {
            if (ir::coversAll(possibleTypes, record.possibleTypes)) mergeField(record.fields, field);
        }
    }
};

} // namespace

TypeCase TypeCaseBuilder::partition(const ir::SelectionSet& selectionSet) const {
    Partition partition(selectionSet.possibleTypes);
    partition.walk(selectionSet, selectionSet.possibleTypes, false);
    return partition.take();
}

} // namespace gqlir

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/type_ref.h — References to named types through List/NonNull
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <vector>

namespace gqlir {

enum class OperationType { Query, Mutation, Subscription };

inline const char* toString(OperationType type) {
    switch (type) {
        case OperationType::Query: return "query";
        case OperationType::Mutation: return "mutation";
        case OperationType::Subscription: return "subscription";
    }
    return "query";
}

// ═══════════════════════════════════════════
//  class TypeRef
//  A named type and its wrapping modifiers, outermost first:
//  `[Pet!]!` is {NonNull, List, NonNull} around "Pet".
// ═══════════════════════════════════════════
class TypeRef {
public:
    enum class Modifier { List, NonNull };

    TypeRef() = default;
    explicit TypeRef(std::string name) : name_(std::move(name)) {}

    // ── Wrapping ──
    TypeRef listOf() const { return wrapped(Modifier::List); }
    TypeRef nonNull() const { return wrapped(Modifier::NonNull); }

    // Strip the outermost modifier.
    TypeRef ofType() const {
        TypeRef inner = *this;
        if (!inner.modifiers_.empty()) inner.modifiers_.erase(inner.modifiers_.begin());
        return inner;
    }

    // ── Inspection ──
    const std::string& namedType() const { return name_; }
    const std::vector<Modifier>& modifiers() const { return modifiers_; }
    bool isNamed() const { return modifiers_.empty(); }
    bool isNonNull() const { return !modifiers_.empty() && modifiers_.front() == Modifier::NonNull; }
    bool isList() const { return !modifiers_.empty() && modifiers_.front() == Modifier::List; }

    std::string toString() const {
        std::string result = name_;
        for (auto it = modifiers_.rbegin(); it != modifiers_.rend(); ++it) {
            result = (*it == Modifier::List) ? "[" + result + "]" : result + "!";
        }
        return result;
    }

    bool operator==(const TypeRef&) const = default;

private:
    std::string name_;
    std::vector<Modifier> modifiers_;

    TypeRef wrapped(Modifier modifier) const {
        TypeRef outer = *this;
        outer.modifiers_.insert(outer.modifiers_.begin(), modifier);
        return outer;
    }
};

} // namespace gqlir

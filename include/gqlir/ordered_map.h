#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/ordered_map.h — Insertion-ordered map keyed by name
// ═══════════════════════════════════════════════════════════════════
//
//  Operations, fragments and schema types are looked up by name but
//  must be emitted in the order they were declared, since generated
//  code and operation ids are order sensitive.
//
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <unordered_map>

namespace gqlir {

template <typename Value, typename Key = std::string>
class OrderedMap {
public:
    using value_type = std::pair<Key, Value>;
    using container_type = std::vector<value_type>;

    // Inserts a new entry or replaces the value of an existing one
    // in place, keeping its original position.
    Value& insertOrAssign(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return entries_[it->second].second = std::move(value);
        }
        index_.emplace(key, entries_.size());
        return entries_.emplace_back(key, std::move(value)).second;
    }

    // Returns false (and leaves the map untouched) if `key` is present.
    bool insert(const Key& key, Value value) {
        if (index_.count(key)) return false;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return true;
    }

    Value* find(const Key& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    const Value* find(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    bool contains(const Key& key) const { return index_.count(key) != 0; }

    const Value& at(const Key& key) const {
        if (auto* value = find(key)) return *value;
        throw std::out_of_range("OrderedMap::at: no entry for key");
    }

    Value& at(const Key& key) {
        if (auto* value = find(key)) return *value;
        throw std::out_of_range("OrderedMap::at: no entry for key");
    }

    std::vector<Key> keys() const {
        std::vector<Key> result;
        result.reserve(entries_.size());
        for (auto& entry : entries_) result.push_back(entry.first);
        return result;
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    auto begin() { return entries_.begin(); }
    auto end() { return entries_.end(); }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    bool operator==(const OrderedMap& other) const { return entries_ == other.entries_; }

private:
    container_type entries_;
    std::unordered_map<Key, std::size_t> index_;
};

} // namespace gqlir

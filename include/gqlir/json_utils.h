#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/json_utils.h — nlohmann/json helpers shared by the compiler
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqlir {

// ─────────────────────────────────────────────
//  Macro: GQLIR_SERIALIZE
//  Makes a plain record auto-serializable to JSON.
//
//  Usage:
//    struct Entry {
//        std::string name;
//        std::string source;
//        GQLIR_SERIALIZE(Entry, name, source)
//    };
// ─────────────────────────────────────────────
#define GQLIR_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

template <JsonSerializable T>
inline nlohmann::json toJson(const T& value) {
    return nlohmann::json(value);
}

template <typename T>
inline T fromJson(const nlohmann::json& j) {
    return j.get<T>();
}

// ── Set `key` only when the optional carries a value ──
template <typename T>
inline void setIfPresent(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

// ── String literal escaping compatible with JSON.stringify ──
inline std::string quote(std::string_view text) {
    return nlohmann::json(std::string(text))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ── Read an optional string member, treating null like absence ──
inline std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace gqlir

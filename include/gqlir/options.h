#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/options.h — Compiler options and their JSON form
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto options = parseCompilerOptions(R"({
//        "mergeInFieldsFromFragmentSpreads": false,
//        "generateOperationIds": true
//    })");
//
//  Keys that are missing keep their defaults; unknown keys are ignored.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace gqlir {

inline constexpr std::size_t kDefaultMaxSelectionDepth = 512;

struct CompilerOptions {
    // Prepend __typename to every field and fragment selection set.
    bool addTypename = false;
    // Fold fields of spread fragments into the type case of the
    // spreading selection set before it is partitioned.
    bool mergeInFieldsFromFragmentSpreads = true;
    // Passed through to code generators.
    bool passthroughCustomScalars = false;
    std::string customScalarsPrefix;
    std::string namespaceName;
    // Compute a SHA-256 operation id for every operation.
    bool generateOperationIds = false;
    // Selection-set levels accepted below and including the root.
    std::size_t maxSelectionDepth = kDefaultMaxSelectionDepth;

    bool operator==(const CompilerOptions&) const = default;
};

inline void to_json(nlohmann::json& j, const CompilerOptions& options) {
    j = nlohmann::json{
        {"addTypename", options.addTypename},
        {"mergeInFieldsFromFragmentSpreads", options.mergeInFieldsFromFragmentSpreads},
        {"passthroughCustomScalars", options.passthroughCustomScalars},
        {"customScalarsPrefix", options.customScalarsPrefix},
        {"namespace", options.namespaceName},
        {"generateOperationIds", options.generateOperationIds},
        {"maxSelectionDepth", options.maxSelectionDepth}
    };
}

inline void from_json(const nlohmann::json& j, CompilerOptions& options) {
    if (!j.is_object()) {
        throw CompilationError("Compiler options must be a JSON object");
    }
    auto read = [&j](const char* key, auto& target) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        try {
            it->get_to(target);
        } catch (const nlohmann::json::exception& e) {
            throw CompilationError(std::string("Invalid value for compiler option '") +
                                   key + "': " + e.what());
        }
    };
    read("addTypename", options.addTypename);
    read("mergeInFieldsFromFragmentSpreads", options.mergeInFieldsFromFragmentSpreads);
    read("passthroughCustomScalars", options.passthroughCustomScalars);
    read("customScalarsPrefix", options.customScalarsPrefix);
    read("namespace", options.namespaceName);
    read("generateOperationIds", options.generateOperationIds);
    read("maxSelectionDepth", options.maxSelectionDepth);
}

inline CompilerOptions parseCompilerOptions(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw CompilationError(std::string("Invalid compiler options JSON: ") + e.what());
    }
    return j.get<CompilerOptions>();
}

} // namespace gqlir

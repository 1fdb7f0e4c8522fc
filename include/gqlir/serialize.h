#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/serialize.h — JSON output of the legacy IR
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto context = legacy::compileToLegacyIR(schema, document, options);
//    std::cout << serializeToJSON(context).dump(2);
//    std::cout << operationIdManifest(context).dump(2);
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "legacy_ir.h"
#include <nlohmann/json.hpp>
#include <string>

namespace gqlir {

// { "operations": [...], "fragments": [...], "typesUsed": [...] }
// Types are printed in GraphQL syntax; absent optionals are omitted.
nlohmann::json serializeToJSON(const legacy::LegacyCompilationContext& context);

struct OperationIdEntry {
    std::string name;
    std::string source;

    GQLIR_SERIALIZE(OperationIdEntry, name, source)
};

// { "<operationId>": { "name": ..., "source": sourceWithFragments } }
// Throws CompilationError unless operation ids were generated.
nlohmann::json operationIdManifest(const legacy::LegacyCompilationContext& context);

} // namespace gqlir

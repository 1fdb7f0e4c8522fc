#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/gqlir.h — Umbrella header for the gqlir compiler
// ═══════════════════════════════════════════════════════════════════
//
//  #include "gqlir/gqlir.h"
//  using namespace gqlir;
//
//  This single include gives you:
//    • buildSchema(), schemaFromIntrospection()
//    • parseDocument(), print()
//    • ir::compileToIR()
//    • legacy::compileToLegacyIR()
//    • serializeToJSON(), operationIdManifest()
//    • console::log(), debug(), setLevel()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "errors.h"
#include "json_utils.h"
#include "console.h"
#include "options.h"

// Schema and documents
#include "schema.h"
#include "parser.h"
#include "printer.h"

// Compilation
#include "ir.h"
#include "type_case.h"
#include "fragments.h"
#include "legacy_ir.h"
#include "serialize.h"

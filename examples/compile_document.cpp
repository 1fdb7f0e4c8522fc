// ═══════════════════════════════════════════════════════════════════
//  compile_document.cpp — Compiling a document to the legacy IR
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Building a schema from SDL
//    • Compiling an operation that spreads a fragment
//    • Printing the legacy IR and the persisted-query manifest
//
//  Pass --debug to see the compiler's own log output.
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/gqlir.h"
#include <cstring>
#include <iostream>

using namespace gqlir;

static const char* kSchema = R"(
    type Query {
        pet(id: ID!): Pet
    }

    interface Pet {
        name: String!
    }

    type Dog implements Pet {
        name: String!
        barkVolume: Int
    }

    type Cat implements Pet {
        name: String!
        lives: Int
    }
)";

static const char* kDocument = R"(
    query PetDetails($id: ID!) {
        pet(id: $id) {
            name
            ... on Dog { barkVolume }
            ... on Cat { ...CatFields }
        }
    }

    fragment CatFields on Cat {
        lives
    }
)";

int main(int argc, char** argv) {
    if (argc > 1 && std::strcmp(argv[1], "--debug") == 0) {
        console::setLevel(console::Level::Debug);
    }

    try {
        auto schema = buildSchema(kSchema);
        auto document = parseDocument(kDocument, "PetDetails.graphql");

        CompilerOptions options;
        options.generateOperationIds = true;
        console::time("compile");
        auto context = legacy::compileToLegacyIR(schema, document, options);
        console::timeEnd("compile", console::Level::Debug);

        std::cout << serializeToJSON(context).dump(2) << std::endl;
        std::cout << operationIdManifest(context).dump(2) << std::endl;

        for (auto& [name, operation] : context.operations) {
            console::success(name, "->", *operation.operationId);
        }
    } catch (const std::exception& e) {
        console::error(e.what());
        return 1;
    }
    return 0;
}

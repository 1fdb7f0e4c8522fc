#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pet_schema.h — Schema shared by the compiler tests
// ═══════════════════════════════════════════════════════════════════

#include <gqlir/schema.h>
#include <memory>

namespace gqlir::fixtures {

inline constexpr const char* kPetSchema = R"(
    schema {
        query: Query
        mutation: Mutation
    }

    type Query {
        pet(id: ID!): Pet
        pets(filter: PetFilter, limit: Int = 10): [Pet!]!
        search(text: String!): [SearchResult]
        owner: Person
    }

    type Mutation {
        adopt(id: ID!, since: Date): Pet
    }

    "Something that lives with a person"
    interface Pet {
        name: String!
        owner: Person
        nickname: String @deprecated(reason: "Use name")
    }

    type Dog implements Pet {
        name: String!
        owner: Person
        nickname: String @deprecated(reason: "Use name")
        barkVolume: Int
        breed: Breed
    }

    type Cat implements Pet {
        name: String!
        owner: Person
        nickname: String @deprecated(reason: "Use name")
        lives: Int
    }

    type Bird implements Pet {
        name: String!
        owner: Person
        nickname: String @deprecated(reason: "Use name")
        wingspan: Float
    }

    type Person {
        "Full name"
        name: String
        pets: [Pet]
    }

    union SearchResult = Person | Dog | Cat

    enum Breed {
        LABRADOR
        POODLE @deprecated
    }

    input PetFilter {
        breed: Breed
        range: DateRange
    }

    input DateRange {
        from: Date
        to: Date
    }

    scalar Date
)";

inline std::shared_ptr<Schema> petSchema() {
    return buildSchema(kPetSchema);
}

} // namespace gqlir::fixtures

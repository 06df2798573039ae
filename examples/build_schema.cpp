// ═══════════════════════════════════════════════════════════════════
//  build_schema.cpp — Assemble a schema from native definitions
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Binding object types to native structs
//    • Interfaces, unions, enums and input types in one graph
//    • Mutually recursive types
//    • Resolving a union member from a runtime value
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/gqlpp.h"
#include <iostream>
#include <vector>

using namespace gqlpp;

struct User {
    std::string name;
    int id;
};

struct Post {
    std::string title;
    int authorId;
};

static std::vector<User> users = {
    {"Alice", 1},
    {"Bob",   2},
};

static void printType(const NamedType& type) {
    std::cout << "  " << nlohmann::json(type.kind()).get<std::string>() << " " << type.name();
    if (const auto* object = typeAs<ObjectType>(type)) {
        std::cout << " {";
        for (const auto& [name, field] : object->fields()) {
            std::cout << " " << name << ": " << field.type->toString();
        }
        std::cout << " }";
    }
    std::cout << "\n";
}

int main() {
    console::setLevel(console::Level::Info);

    // ── Types ──
    TypeDefinition node{.name = "Node", .kind = TypeDefinition::Kind::Interface};
    node.fields.push_back({.name = "id", .type = TypeRef::scalar(BuiltinScalar::ID)});

    TypeDefinition user{.name = "User", .description = "A registered user", .origin = typeid(User)};
    TypeDefinition post{.name = "Post", .origin = typeid(Post)};

    user.interfaces.push_back(&node);
    user.fields.push_back({.name = "id", .type = TypeRef::scalar(BuiltinScalar::ID)});
    user.fields.push_back({.name = "name", .type = TypeRef::scalar(BuiltinScalar::String)});
    user.fields.push_back({.name = "posts", .type = TypeRef::list(TypeRef::named(post))});

    post.interfaces.push_back(&node);
    post.fields.push_back({.name = "id", .type = TypeRef::scalar(BuiltinScalar::ID)});
    post.fields.push_back({.name = "title", .type = TypeRef::scalar(BuiltinScalar::String)});
    post.fields.push_back({.name = "author", .type = TypeRef::named(user)});

    EnumDefinition order{.name = "Order", .values = {{"ASC", JsonValue("asc")},
                                                     {"DESC", JsonValue("desc")}}};
    UnionDefinition searchResult{.name = "SearchResult",
                                 .types = {TypeRef::named(user), TypeRef::named(post)}};

    TypeDefinition newUser{.name = "NewUser", .kind = TypeDefinition::Kind::Input};
    newUser.fields.push_back({.name = "name", .type = TypeRef::scalar(BuiltinScalar::String)});

    // ── Roots ──
    TypeDefinition query{.name = "Query"};
    query.fields.push_back({
        .name = "user",
        .type = TypeRef::optional(TypeRef::named(user)),
        .arguments = {{.name = "id", .type = TypeRef::scalar(BuiltinScalar::ID)}},
        .resolver = [](const std::any&, const JsonValue& args, const ResolveInfo&) -> std::any {
            int id = std::stoi(args["id"].get<std::string>());
            for (const auto& u : users) {
                if (u.id == id) return u;
            }
            return {};
        },
    });
    query.fields.push_back({
        .name = "search",
        .type = TypeRef::list(TypeRef::unionOf(searchResult)),
        .arguments = {{.name = "order", .type = TypeRef::optional(TypeRef::enumeration(order)),
                       .defaultValue = DefaultValue::of("asc")}},
    });

    TypeDefinition mutation{.name = "Mutation"};
    mutation.fields.push_back({
        .name = "createUser",
        .type = TypeRef::named(user),
        .arguments = {{.name = "input", .type = TypeRef::named(newUser)}},
    });

    // ── Build ──
    SchemaDefinition definition{.query = &query, .mutation = &mutation};
    try {
        Schema schema = Schema::build(definition);

        std::cout << "Types:\n";
        for (const auto& name : schema.typeMap().names()) {
            printType(*schema.getType(name));
        }

        const Field* lookup = schema.queryType().field("user");
        std::any found = lookup->resolve(std::any(), JsonValue(nlohmann::json{{"id", "2"}}),
                                         ResolveInfo{.fieldName = "user"});
        std::cout << "user(id: 2) -> " << std::any_cast<User>(found).name << "\n";

        const auto* result = typeAs<UnionType>(*schema.getType("SearchResult"));
        const ObjectType& hit = result->resolveType(std::any(Post{"Hello", 1}),
                                                    ResolveInfo{.fieldName = "search"});
        std::cout << "search hit resolves to " << hit.name() << "\n";
    } catch (const SchemaError& e) {
        console::error("build_schema:", e.what());
        return 1;
    }
    return 0;
}

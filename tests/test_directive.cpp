// ═══════════════════════════════════════════════════════════════════
//  test_directive.cpp — Directive builder
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlpp/converter.h>

using namespace gqlpp;

TEST(DirectiveTest, BuildsLocationsAndArguments) {
    TypeCache cache;
    BuildContext ctx(cache);
    DirectiveDefinition cacheControl{
        .name = "cacheControl",
        .locations = {DirectiveLocation::FieldDefinition, DirectiveLocation::Object},
        .arguments = {
            {.name = "maxAge", .type = TypeRef::optional(TypeRef::scalar(BuiltinScalar::Int)),
             .defaultValue = DefaultValue::of(60)},
            {.name = "scope", .type = TypeRef::optional(TypeRef::scalar(BuiltinScalar::String))},
        },
        .description = "Cache hints for responses",
    };

    Directive directive = convert::fromDirective(ctx, cacheControl);

    EXPECT_EQ(directive.name, "cacheControl");
    EXPECT_EQ(directive.description, "Cache hints for responses");
    ASSERT_EQ(directive.locations.size(), 2u);
    EXPECT_EQ(directive.locations[0], DirectiveLocation::FieldDefinition);
    EXPECT_EQ(directive.locations[1], DirectiveLocation::Object);

    ASSERT_EQ(directive.args.size(), 2u);
    ASSERT_NE(directive.arg("maxAge"), nullptr);
    EXPECT_EQ(directive.arg("maxAge")->type->toString(), "Int");
    EXPECT_EQ(directive.arg("maxAge")->defaultValue->get<int>(), 60);
    EXPECT_FALSE(directive.arg("scope")->hasDefault());
    EXPECT_EQ(directive.arg("missing"), nullptr);
}

TEST(DirectiveTest, ArgumentTypesJoinTheCache) {
    TypeCache cache;
    BuildContext ctx(cache);
    EnumDefinition scope{.name = "CacheScope", .values = {{"PUBLIC", JsonValue("public")},
                                                          {"PRIVATE", JsonValue("private")}}};
    DirectiveDefinition hint{
        .name = "hint",
        .locations = {DirectiveLocation::Field},
        .arguments = {{.name = "scope", .type = TypeRef::enumeration(scope)}},
    };

    Directive directive = convert::fromDirective(ctx, hint);

    EXPECT_EQ(directive.arg("scope")->type->toString(), "CacheScope!");
    EXPECT_NE(cache.getAs<EnumType>("CacheScope"), nullptr);
}

TEST(DirectiveTest, LocationNames) {
    EXPECT_EQ(nlohmann::json(DirectiveLocation::InputFieldDefinition).get<std::string>(),
              "INPUT_FIELD_DEFINITION");
    EXPECT_EQ(nlohmann::json("FRAGMENT_SPREAD").get<DirectiveLocation>(),
              DirectiveLocation::FragmentSpread);
}

TEST(DirectiveTest, UnnamedArgumentNamesTheDirective) {
    TypeCache cache;
    BuildContext ctx(cache);
    DirectiveDefinition broken{
        .name = "broken",
        .locations = {DirectiveLocation::Field},
        .arguments = {{.name = "", .type = TypeRef::scalar(BuiltinScalar::Int)}},
    };

    try {
        convert::fromDirective(ctx, broken);
        FAIL() << "expected InternalConsistencyError";
    } catch (const InternalConsistencyError& e) {
        EXPECT_NE(std::string(e.what()).find("'@broken'"), std::string::npos);
    }
}

TEST(DirectiveTest, UnnamedDirectiveIsRejected) {
    TypeCache cache;
    BuildContext ctx(cache);
    DirectiveDefinition unnamed{.locations = {DirectiveLocation::Query}};

    EXPECT_THROW(convert::fromDirective(ctx, unnamed), InternalConsistencyError);
}

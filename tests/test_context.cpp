// ═══════════════════════════════════════════════════════════════════
//  test_context.cpp — Two-phase build and context lifetime
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlpp/converter.h>
#include <sstream>
#include <stdexcept>

using namespace gqlpp;

class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = console::level();
        console::setStreams(out_, err_);
        console::setColors(false);
        console::setLevel(console::Level::Warn);

        // Query -> User -> Post -> User
        user.fields.push_back({.name = "posts", .type = TypeRef::list(TypeRef::named(post))});
        post.fields.push_back({.name = "author", .type = TypeRef::named(user)});
        post.fields.push_back({.name = "title", .type = TypeRef::scalar(BuiltinScalar::String)});
        query.fields.push_back({.name = "me", .type = TypeRef::optional(TypeRef::named(user))});
    }

    void TearDown() override {
        console::resetStreams();
        console::setColors(true);
        console::setLevel(saved_);
    }

    TypeDefinition query{.name = "Query"};
    TypeDefinition user{.name = "User"};
    TypeDefinition post{.name = "Post"};

    std::ostringstream out_;
    std::ostringstream err_;
    console::Level saved_ = console::Level::Warn;
};

TEST_F(ContextTest, PhaseOneRegistersSkeletonsOnly) {
    TypeCache cache;
    BuildContext ctx(cache);

    const auto& root = convert::fromObjectType(ctx, query);

    EXPECT_FALSE(root.populated());
    EXPECT_EQ(ctx.pendingCount(), 1u);
    EXPECT_EQ(ctx.stats().skeletons, 1u);
    EXPECT_EQ(ctx.stats().populated, 0u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ContextTest, PopulateDrainsTypesReachedWhilePopulating) {
    TypeCache cache;
    BuildContext ctx(cache);
    convert::fromObjectType(ctx, query);

    std::size_t populated = ctx.populatePending();

    EXPECT_EQ(populated, 3u);
    EXPECT_EQ(ctx.pendingCount(), 0u);
    EXPECT_EQ(ctx.stats().skeletons, 3u);
    EXPECT_EQ(ctx.stats().populated, 3u);
    EXPECT_EQ(cache.names(), (std::vector<std::string>{"Query", "User", "Post"}));
    for (const auto& name : cache.names()) {
        EXPECT_TRUE(cache.getAs<ObjectType>(name)->populated()) << name;
    }
}

TEST_F(ContextTest, PopulateIsRepeatable) {
    TypeCache cache;
    BuildContext ctx(cache);
    convert::fromObjectType(ctx, query);

    EXPECT_EQ(ctx.populatePending(), 3u);
    EXPECT_EQ(ctx.populatePending(), 0u);
}

TEST_F(ContextTest, LazyAccessCountsOnce) {
    TypeCache cache;
    BuildContext ctx(cache);
    const auto& root = convert::fromObjectType(ctx, query);

    root.fields();
    EXPECT_EQ(ctx.stats().populated, 1u);

    // Query is already populated; only User and Post remain
    EXPECT_EQ(ctx.populatePending(), 2u);
    EXPECT_EQ(ctx.stats().populated, 3u);
}

TEST_F(ContextTest, DestroyedContextDetachesPendingSkeletons) {
    TypeCache cache;
    const ObjectType* root = nullptr;
    {
        BuildContext ctx(cache);
        root = &convert::fromObjectType(ctx, query);
    }

    EXPECT_THROW(root->fields(), InternalConsistencyError);
    EXPECT_NE(err_.str().find("unpopulated"), std::string::npos);
}

TEST_F(ContextTest, LaterContextAdoptsDetachedSkeleton) {
    TypeCache cache;
    const ObjectType* root = nullptr;
    {
        BuildContext first(cache);
        root = &convert::fromObjectType(first, query);
    }

    BuildContext second(cache);
    EXPECT_EQ(&convert::fromObjectType(second, query), root);
    EXPECT_EQ(second.pendingCount(), 1u);
    EXPECT_EQ(second.populatePending(), 3u);
    ASSERT_EQ(root->fields().size(), 1u);
}

TEST_F(ContextTest, PopulatePassAdoptsOrphans) {
    TypeCache cache;
    {
        BuildContext first(cache);
        convert::fromObjectType(first, query).fields();
    }
    // User was reached through Query and left unpopulated
    ASSERT_FALSE(cache.getAs<ObjectType>("User")->populated());

    BuildContext second(cache);
    EXPECT_EQ(second.populatePending(), 2u);
    EXPECT_EQ(cache.getAs<ObjectType>("User")->fields().size(), 1u);
    EXPECT_TRUE(cache.getAs<ObjectType>("Post")->populated());
}

TEST_F(ContextTest, TransactionRollsBackOnThrow) {
    TypeCache cache;
    BuildContext ctx(cache);
    convert::fromObjectType(ctx, query);

    EXPECT_THROW(ctx.transaction([&] {
        convert::fromObjectType(ctx, user);
        throw std::runtime_error("abort");
    }), std::runtime_error);

    EXPECT_EQ(cache.names(), (std::vector<std::string>{"Query"}));
    EXPECT_EQ(ctx.pendingCount(), 1u);
    EXPECT_NE(err_.str().find("rolled back 1 type(s)"), std::string::npos);

    EXPECT_EQ(ctx.populatePending(), 3u);
}

TEST_F(ContextTest, RollbackForgetsFieldMapsReachingDroppedTypes) {
    TypeDefinition notAnInterface{.name = "NotAnInterface"};
    TypeDefinition broken{.name = "Broken"};
    broken.interfaces.push_back(&notAnInterface);
    TypeDefinition holder{.name = "Holder"};
    holder.fields.push_back({.name = "me", .type = TypeRef::named(user)});
    TypeDefinition bad{.name = "Bad"};
    bad.fields.push_back({.name = "broken", .type = TypeRef::named(broken)});

    Converter converter;
    const auto& holderType = converter.fromObjectType(holder);
    converter.fromObjectType(bad);

    // Holder is populated, then Bad fails and takes User with it
    EXPECT_THROW(converter.finalize(), WrongKindForBuilder);
    EXPECT_FALSE(holderType.populated());
    EXPECT_EQ(converter.typeMap().names(), (std::vector<std::string>{"Holder", "Bad"}));
    EXPECT_EQ(converter.context().pendingCount(), 2u);

    bad.fields.clear();
    EXPECT_EQ(converter.finalize(), 4u);
    EXPECT_EQ(&namedTypeOf(*holderType.field("me")->type),
              converter.typeMap().getAs<ObjectType>("User"));
}

TEST_F(ContextTest, PopulatedTypesOutliveTheirContext) {
    TypeCache cache;
    const ObjectType* root = nullptr;
    {
        BuildContext ctx(cache);
        root = &convert::fromObjectType(ctx, query);
        ctx.populatePending();
    }

    ASSERT_EQ(root->fields().size(), 1u);
    EXPECT_EQ(root->field("me")->type, cache.getAs<ObjectType>("User"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ContextTest, SharedCacheAcrossContexts) {
    TypeCache cache;
    BuildContext first(cache);
    const auto& fromFirst = convert::fromObjectType(first, query);
    first.populatePending();

    BuildContext second(cache);
    const auto& fromSecond = convert::fromObjectType(second, query);

    EXPECT_EQ(&fromFirst, &fromSecond);
    EXPECT_EQ(second.pendingCount(), 0u);
    EXPECT_EQ(second.stats().skeletons, 0u);
}

TEST_F(ContextTest, AppliesLogLevelWhenAsked) {
    TypeCache cache;
    console::setLevel(console::Level::Silent);

    BuildContext quiet(cache, ConverterOptions{.logLevel = console::Level::Info});
    EXPECT_EQ(console::level(), console::Level::Silent);

    BuildContext chatty(cache, ConverterOptions{.logLevel = console::Level::Info,
                                                .applyLogLevel = true});
    EXPECT_EQ(console::level(), console::Level::Info);

    convert::fromObjectType(chatty, query);
    chatty.populatePending();
    EXPECT_NE(out_.str().find("populated 3 type(s)"), std::string::npos);
}

TEST_F(ContextTest, ConverterFinalize) {
    Converter converter;
    converter.fromObjectType(query);

    EXPECT_EQ(converter.context().pendingCount(), 1u);
    EXPECT_EQ(converter.finalize(), 3u);
    EXPECT_EQ(converter.typeMap().size(), 3u);
}

// ═══════════════════════════════════════════════════════════════════
//  test_union.cpp — Union builder and runtime type resolution
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlpp/converter.h>

using namespace gqlpp;

namespace {

struct Cat { std::string name; };
struct Dog { std::string name; };
struct Bird {};
struct Rock {};

} // namespace

class UnionTest : public ::testing::Test {
protected:
    TypeCache cache;
    BuildContext ctx{cache};

    TypeDefinition cat{.name = "Cat", .origin = typeid(Cat)};
    TypeDefinition dog{.name = "Dog", .origin = typeid(Dog)};
    TypeDefinition bird{.name = "Bird", .origin = typeid(Bird)};
    UnionDefinition pet{
        .name = "Pet",
        .description = "Anything kept at home",
        .types = {TypeRef::named(cat), TypeRef::named(dog), TypeRef::named(bird)},
    };

    ResolveInfo info{.fieldName = "pet", .parentTypeName = "Query"};
};

TEST_F(UnionTest, BuildsMembersInOrder) {
    const auto& type = convert::fromUnion(ctx, pet);

    EXPECT_EQ(type.name(), "Pet");
    EXPECT_EQ(type.description(), "Anything kept at home");
    ASSERT_EQ(type.types().size(), 3u);
    EXPECT_EQ(type.types()[0]->name(), "Cat");
    EXPECT_EQ(type.types()[1]->name(), "Dog");
    EXPECT_EQ(type.types()[2]->name(), "Bird");
    EXPECT_EQ(type.types()[1], cache.getAs<ObjectType>("Dog"));
    EXPECT_EQ(cache.size(), 4u);
}

TEST_F(UnionTest, DefaultResolverMatchesOrigin) {
    const auto& type = convert::fromUnion(ctx, pet);

    const ObjectType& resolved = type.resolveType(std::any(Dog{"Rex"}), info);
    EXPECT_EQ(resolved.name(), "Dog");
    EXPECT_EQ(&resolved, type.types()[1]);
    EXPECT_EQ(type.resolveType(std::any(Bird{}), info).name(), "Bird");
}

TEST_F(UnionTest, UnrelatedValueIsRejected) {
    const auto& type = convert::fromUnion(ctx, pet);

    try {
        type.resolveType(std::any(Rock{}), info);
        FAIL() << "expected WrongReturnTypeForUnion";
    } catch (const WrongReturnTypeForUnion& e) {
        EXPECT_EQ(e.fieldName(), "pet");
        EXPECT_NE(std::string(e.what()).find("matches no member"), std::string::npos);
    }
    EXPECT_THROW(type.resolveType(std::any(), info), WrongReturnTypeForUnion);
}

TEST_F(UnionTest, RejectedValueIsNamedReadably) {
    const auto& type = convert::fromUnion(ctx, pet);

    try {
        type.resolveType(std::any(Rock{}), info);
        FAIL() << "expected WrongReturnTypeForUnion";
    } catch (const WrongReturnTypeForUnion& e) {
        EXPECT_EQ(e.returnType(), "<unknown>");
        EXPECT_NE(std::string(e.what()).find("\"<unknown>\""), std::string::npos);
        EXPECT_EQ(std::string(e.what()).find(typeid(Rock).name()), std::string::npos);
    }

    try {
        type.resolveType(std::any(), info);
        FAIL() << "expected WrongReturnTypeForUnion";
    } catch (const WrongReturnTypeForUnion& e) {
        EXPECT_EQ(e.returnType(), "null");
    }
}

TEST_F(UnionTest, Idempotent) {
    const auto& first = convert::fromUnion(ctx, pet);
    const auto& second = convert::resolveNamedType(ctx, TypeRef::unionOf(pet));

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(convert::resolveType(ctx, TypeRef::unionOf(pet)).toString(), "Pet!");
    EXPECT_EQ(cache.size(), 4u);
}

TEST_F(UnionTest, OptionalMembersAreUnwrapped) {
    UnionDefinition loose{.name = "Loose", .types = {TypeRef::optional(TypeRef::named(cat))}};
    const auto& type = convert::fromUnion(ctx, loose);

    ASSERT_EQ(type.types().size(), 1u);
    EXPECT_EQ(type.resolveType(std::any(Cat{"Tom"}), info).name(), "Cat");
}

TEST_F(UnionTest, CustomResolverFactory) {
    UnionDefinition named{
        .name = "Named",
        .types = {TypeRef::named(cat), TypeRef::named(dog)},
        .typeResolverFactory = [](const TypeCache& types) -> TypeResolver {
            const ObjectType* catType = types.getAs<ObjectType>("Cat");
            const ObjectType* dogType = types.getAs<ObjectType>("Dog");
            return [catType, dogType](const std::any& value,
                                      const ResolveInfo&) -> const ObjectType& {
                const auto& name = std::any_cast<const std::string&>(value);
                return name.rfind("cat:", 0) == 0 ? *catType : *dogType;
            };
        },
    };

    const auto& type = convert::fromUnion(ctx, named);

    EXPECT_EQ(type.resolveType(std::any(std::string("cat:Tom")), info).name(), "Cat");
    EXPECT_EQ(type.resolveType(std::any(std::string("dog:Rex")), info).name(), "Dog");
}

TEST_F(UnionTest, ResolverReturningANonMemberIsRejected) {
    UnionDefinition onlyCats{
        .name = "OnlyCats",
        .types = {TypeRef::named(cat)},
        .typeResolverFactory = [this](const TypeCache&) -> TypeResolver {
            return [this](const std::any&, const ResolveInfo&) -> const ObjectType& {
                return convert::fromObjectType(ctx, dog);
            };
        },
    };

    const auto& type = convert::fromUnion(ctx, onlyCats);
    EXPECT_THROW(type.resolveType(std::any(Cat{}), info), WrongReturnTypeForUnion);
}

// ═══════════════════════════════════════════
//  Unallowed members
// ═══════════════════════════════════════════

TEST_F(UnionTest, NonObjectMemberIsRejected) {
    EnumDefinition color{.name = "Color", .values = {{"RED", JsonValue(0)}}};
    UnionDefinition mixed{.name = "Mixed", .types = {TypeRef::named(cat), TypeRef::enumeration(color)}};

    try {
        convert::fromUnion(ctx, mixed);
        FAIL() << "expected UnallowedReturnTypeForUnion";
    } catch (const UnallowedReturnTypeForUnion& e) {
        EXPECT_EQ(e.unionName(), "Mixed");
        EXPECT_EQ(e.memberName(), "Color");
    }
    EXPECT_FALSE(cache.has("Mixed"));
}

TEST_F(UnionTest, ScalarAndInterfaceMembersAreRejected) {
    TypeDefinition node{.name = "Node", .kind = TypeDefinition::Kind::Interface};
    UnionDefinition withScalar{.name = "WithScalar", .types = {TypeRef::scalar(BuiltinScalar::Int)}};
    UnionDefinition withInterface{.name = "WithInterface", .types = {TypeRef::named(node)}};

    EXPECT_THROW(convert::fromUnion(ctx, withScalar), UnallowedReturnTypeForUnion);
    EXPECT_THROW(convert::fromUnion(ctx, withInterface), UnallowedReturnTypeForUnion);
}

TEST_F(UnionTest, NestedUnionIsRejected) {
    UnionDefinition outer{.name = "Outer", .types = {TypeRef::named(cat), TypeRef::unionOf(pet)}};

    EXPECT_THROW(convert::fromUnion(ctx, outer), UnallowedReturnTypeForUnion);
    EXPECT_FALSE(cache.has("Pet"));
    EXPECT_FALSE(cache.has("Outer"));
}

TEST_F(UnionTest, SelfReferencingUnionTerminates) {
    UnionDefinition self{.name = "Self"};
    self.types = {TypeRef::named(cat), TypeRef::optional(TypeRef::unionOf(self))};

    EXPECT_THROW(convert::fromUnion(ctx, self), UnallowedReturnTypeForUnion);
}

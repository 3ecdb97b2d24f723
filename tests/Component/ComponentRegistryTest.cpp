#include <gtest/gtest.h>
#include "Orrery/Component/ComponentRegistry.hpp"
#include "../TestComponents.hpp"

class ComponentRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Use test components from shared header
using namespace Orrery::Test;

// Test basic component registration
TEST_F(ComponentRegistryTest, BasicRegistration)
{
    Orrery::ComponentRegistry registry;

    auto id = registry.Register<Position>();
    ASSERT_TRUE(id);
    EXPECT_EQ(*id, Orrery::TypeID<Position>::Value());

    const Orrery::ComponentDescriptor* desc = registry.GetDescriptor(*id);
    ASSERT_NE(desc, nullptr);
    EXPECT_EQ(desc->id, *id);
    EXPECT_EQ(desc->size, sizeof(Position));
    EXPECT_EQ(desc->alignment, alignof(Position));
    EXPECT_TRUE(desc->name.empty());
    EXPECT_NE(desc->typeName.find("Position"), std::string_view::npos);
}

// Test registering multiple components at once
TEST_F(ComponentRegistryTest, MultipleRegistration)
{
    Orrery::ComponentRegistry registry;
    registry.RegisterComponents<Position, Velocity, Health>();

    EXPECT_EQ(registry.Size(), 3u);
    EXPECT_NE(registry.GetDescriptor(Orrery::TypeID<Position>::Value()), nullptr);
    EXPECT_NE(registry.GetDescriptor(Orrery::TypeID<Velocity>::Value()), nullptr);
    EXPECT_NE(registry.GetDescriptor(Orrery::TypeID<Health>::Value()), nullptr);
}

// Test duplicate registration (should be idempotent)
TEST_F(ComponentRegistryTest, DuplicateRegistration)
{
    Orrery::ComponentRegistry registry;

    auto first = registry.Register<Position>("pos");
    auto second = registry.Register<Position>("pos");
    auto third = registry.Register<Position>();

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(third);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(registry.Size(), 1u);
}

// Names are resolved back to ids
TEST_F(ComponentRegistryTest, LookupByName)
{
    Orrery::ComponentRegistry registry;
    ASSERT_TRUE(registry.Register<Position>("pos"));
    ASSERT_TRUE(registry.Register<Velocity>("vel"));

    auto pos = registry.FindByName("pos");
    ASSERT_TRUE(pos);
    EXPECT_EQ(*pos, Orrery::TypeID<Position>::Value());
    EXPECT_EQ(registry.GetDescriptor(*pos)->name, "pos");

    auto missing = registry.FindByName("health");
    EXPECT_EQ(missing, Orrery::ErrorCode::NotFound);

    auto all = registry.Resolve({"vel", "pos"});
    ASSERT_TRUE(all);
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ((*all)[0], Orrery::TypeID<Velocity>::Value());

    EXPECT_FALSE(registry.Resolve({"pos", "nope"}));
}

// A name belongs to exactly one type and a type carries at most one name
TEST_F(ComponentRegistryTest, NameCollisions)
{
    Orrery::ComponentRegistry registry;
    ASSERT_TRUE(registry.Register<Position>("pos"));

    auto taken = registry.Register<Velocity>("pos");
    EXPECT_EQ(taken, Orrery::ErrorCode::AlreadyExists);

    auto renamed = registry.Register<Position>("position");
    EXPECT_EQ(renamed, Orrery::ErrorCode::AlreadyExists);

    EXPECT_EQ(*registry.FindByName("pos"), Orrery::TypeID<Position>::Value());
    EXPECT_FALSE(registry.FindByName("position"));
}

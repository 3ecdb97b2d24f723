#include <gtest/gtest.h>
#include <fmt/format.h>
#include "Orrery/Commands/CommandBuffer.hpp"

using Orrery::CommandBuffer;
using Orrery::Entity;
using Orrery::SystemHandle;
using Orrery::Commands::CommandKind;

class CommandBufferTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}

    CommandBuffer buffer;
};

TEST_F(CommandBufferTest, StartsEmpty)
{
    EXPECT_TRUE(buffer.IsEmpty());
    EXPECT_FALSE(buffer.HasEntityCommands());
    EXPECT_FALSE(buffer.HasSystemCommands());
    EXPECT_FALSE(buffer.GetStatus(Entity(0, 1)).has_value());
}

// Last command per entity wins, first-command order is kept
TEST_F(CommandBufferTest, LastEntityCommandWins)
{
    Entity a(1, 1);
    Entity b(2, 1);

    buffer.Push(a, CommandKind::AddEntity);
    buffer.Push(b, CommandKind::AddEntity);
    buffer.Push(a, CommandKind::RemoveEntity);

    EXPECT_EQ(buffer.GetEntityCommandCount(), 2u);
    EXPECT_EQ(buffer.GetStatus(a), CommandKind::RemoveEntity);

    auto commands = buffer.TakeEntityCommands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0].entity, a);
    EXPECT_EQ(commands[0].kind, CommandKind::RemoveEntity);
    EXPECT_EQ(commands[1].entity, b);
    EXPECT_EQ(commands[1].kind, CommandKind::AddEntity);
}

TEST_F(CommandBufferTest, RemoveDoesNotDowngradeDestroy)
{
    Entity e(3, 1);

    buffer.Push(e, CommandKind::DestroyEntity);
    buffer.Push(e, CommandKind::RemoveEntity);
    EXPECT_EQ(buffer.GetStatus(e), CommandKind::DestroyEntity);

    buffer.Push(e, CommandKind::AddEntity);
    EXPECT_EQ(buffer.GetStatus(e), CommandKind::AddEntity);
}

// Taking a queue detaches it, later pushes start a fresh batch
TEST_F(CommandBufferTest, TakeDetachesEntityCommands)
{
    Entity e(5, 1);
    buffer.Push(e, CommandKind::AddEntity);

    auto first = buffer.TakeEntityCommands();
    EXPECT_EQ(first.size(), 1u);
    EXPECT_FALSE(buffer.HasEntityCommands());
    EXPECT_FALSE(buffer.GetStatus(e).has_value());

    buffer.Push(e, CommandKind::RemoveEntity);
    auto second = buffer.TakeEntityCommands();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].kind, CommandKind::RemoveEntity);
}

TEST_F(CommandBufferTest, SystemQueuesKeepOrder)
{
    SystemHandle s1(0, 1);
    SystemHandle s2(1, 1);

    buffer.Push(s2, CommandKind::AddSystem);
    buffer.Push(s1, CommandKind::AddSystem);
    buffer.Push(s1, CommandKind::RemoveSystem);

    auto batch = buffer.TakeSystemCommands();
    EXPECT_EQ(batch.additions, (std::vector<SystemHandle>{s2, s1}));
    EXPECT_EQ(batch.removals, (std::vector<SystemHandle>{s1}));
    EXPECT_TRUE(batch.releases.empty());
    EXPECT_FALSE(buffer.HasSystemCommands());
}

TEST_F(CommandBufferTest, DestroySystemQueuesRemovalAndRelease)
{
    SystemHandle s(2, 1);

    buffer.Push(s, CommandKind::DestroySystem);
    buffer.Push(s, CommandKind::DestroySystem);
    EXPECT_TRUE(buffer.IsReleasePending(s));

    auto batch = buffer.TakeSystemCommands();
    EXPECT_EQ(batch.removals.size(), 2u);
    EXPECT_EQ(batch.releases, (std::vector<SystemHandle>{s}));
}

TEST_F(CommandBufferTest, ReplaceSystemRemovals)
{
    SystemHandle s1(0, 1);
    SystemHandle s2(1, 1);
    buffer.Push(s1, CommandKind::RemoveSystem);

    buffer.ReplaceSystemRemovals({s2, s1});
    auto batch = buffer.TakeSystemCommands();
    EXPECT_EQ(batch.removals, (std::vector<SystemHandle>{s2, s1}));
}

TEST_F(CommandBufferTest, ClearDropsEverything)
{
    buffer.Push(Entity(0, 1), CommandKind::AddEntity);
    buffer.Push(SystemHandle(0, 1), CommandKind::AddSystem);
    EXPECT_FALSE(buffer.IsEmpty());

    buffer.Clear();
    EXPECT_TRUE(buffer.IsEmpty());
}

TEST_F(CommandBufferTest, KindsFormatByName)
{
    EXPECT_EQ(fmt::format("{}", CommandKind::DestroyEntity), "DestroyEntity");
}

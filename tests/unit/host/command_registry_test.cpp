#include <gtest/gtest.h>

#include <plughost/host/command_registry.h>

using namespace plughost;
using namespace plughost::host;

namespace {

CommandSpec makeSpec(const std::string& name, PluginId plugin, uint32_t entry = 0) {
    CommandSpec s;
    s.name = name;
    s.plugin = plugin;
    s.entry = entry;
    s.signature.args = {ValueKind::String};
    s.signature.returns = ValueKind::String;
    return s;
}

} // namespace

TEST(CommandRegistryTest, RegisterThenResolve) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("echo", 1, 3)));

    auto spec = reg.resolve("echo");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->plugin, 1u);
    EXPECT_EQ(spec->entry, 3u);
    EXPECT_EQ(spec->signature.returns, ValueKind::String);
}

TEST(CommandRegistryTest, ResolveAbsentIsNotAnError) {
    CommandRegistry reg;
    EXPECT_FALSE(reg.resolve("nope").has_value());
}

TEST(CommandRegistryTest, FirstRegistrationWinsOnCollision) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("status", 1, 0)));

    auto r = reg.registerCommand(makeSpec("status", 2, 5));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NameCollision);

    auto spec = reg.resolve("status");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->plugin, 1u);
    EXPECT_EQ(spec->entry, 0u);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(CommandRegistryTest, ReservedNamesCollide) {
    CommandRegistry reg;
    reg.reserve("help");
    EXPECT_TRUE(reg.isReserved("help"));

    auto r = reg.registerCommand(makeSpec("help", 1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NameCollision);
    EXPECT_FALSE(reg.resolve("help").has_value());
}

TEST(CommandRegistryTest, UnregisterAllRemovesOnlyThatPlugin) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("a1", 1)));
    ASSERT_TRUE(reg.registerCommand(makeSpec("a2", 1)));
    ASSERT_TRUE(reg.registerCommand(makeSpec("b1", 2)));

    EXPECT_EQ(reg.unregisterAll(1), 2u);
    EXPECT_FALSE(reg.resolve("a1").has_value());
    EXPECT_FALSE(reg.resolve("a2").has_value());
    EXPECT_TRUE(reg.resolve("b1").has_value());
}

TEST(CommandRegistryTest, UnregisterAllIsIdempotent) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("a1", 1)));
    ASSERT_TRUE(reg.registerCommand(makeSpec("b1", 2)));

    reg.unregisterAll(1);
    auto once = reg.commands();
    EXPECT_EQ(reg.unregisterAll(1), 0u);
    auto twice = reg.commands();

    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].name, twice[i].name);
        EXPECT_EQ(once[i].plugin, twice[i].plugin);
    }
}

TEST(CommandRegistryTest, NameFreedByUnregisterCanBeReused) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("status", 1)));
    reg.unregisterAll(1);
    ASSERT_TRUE(reg.registerCommand(makeSpec("status", 2)));
    EXPECT_EQ(reg.resolve("status")->plugin, 2u);
}

TEST(CommandRegistryTest, CommandsAreSortedAndCommandsOfFilters) {
    CommandRegistry reg;
    ASSERT_TRUE(reg.registerCommand(makeSpec("zeta", 1)));
    ASSERT_TRUE(reg.registerCommand(makeSpec("alpha", 2)));
    ASSERT_TRUE(reg.registerCommand(makeSpec("mid", 1)));

    auto all = reg.commands();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "alpha");
    EXPECT_EQ(all[2].name, "zeta");

    auto mine = reg.commandsOf(1);
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_EQ(mine[0], "mid");
    EXPECT_EQ(mine[1], "zeta");
}

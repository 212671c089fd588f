// Verifies DispatchFsm walks Idle -> Parsing -> Resolving -> Invoking -> Idle and ends in Shutdown.
#include <gtest/gtest.h>

#include <plughost/host/dispatch_fsm.h>

using namespace plughost::host;

TEST(DispatchFsmTest, FullCycleReturnsToIdle) {
    DispatchFsm fsm;
    EXPECT_EQ(fsm.snapshot().state, DispatchState::Idle);

    fsm.dispatch(LineReceivedEvent{});
    EXPECT_EQ(fsm.snapshot().state, DispatchState::Parsing);

    fsm.dispatch(LineParsedEvent{"echo"});
    EXPECT_EQ(fsm.snapshot().state, DispatchState::Resolving);
    EXPECT_EQ(fsm.snapshot().command, "echo");

    fsm.dispatch(CommandResolvedEvent{7});
    auto invoking = fsm.snapshot();
    EXPECT_EQ(invoking.state, DispatchState::Invoking);
    ASSERT_TRUE(invoking.invokingPlugin.has_value());
    EXPECT_EQ(*invoking.invokingPlugin, 7u);

    fsm.dispatch(CommandCompletedEvent{});
    auto done = fsm.snapshot();
    EXPECT_EQ(done.state, DispatchState::Idle);
    EXPECT_FALSE(done.invokingPlugin.has_value());
    EXPECT_EQ(done.dispatched, 1u);
}

TEST(DispatchFsmTest, EmptyLineGoesStraightBackToIdle) {
    DispatchFsm fsm;
    fsm.dispatch(LineReceivedEvent{});
    fsm.dispatch(EmptyLineEvent{});
    EXPECT_EQ(fsm.snapshot().state, DispatchState::Idle);
    EXPECT_EQ(fsm.snapshot().dispatched, 0u);
}

TEST(DispatchFsmTest, FailureRecordsErrorAndReturnsToIdle) {
    DispatchFsm fsm;
    fsm.dispatch(LineReceivedEvent{});
    fsm.dispatch(LineParsedEvent{"nope"});
    fsm.dispatch(CommandFailedEvent{"unknown command `nope`"});
    auto s = fsm.snapshot();
    EXPECT_EQ(s.state, DispatchState::Idle);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_NE(s.lastError.find("nope"), std::string::npos);
}

TEST(DispatchFsmTest, ShutdownIsTerminal) {
    DispatchFsm fsm;
    fsm.dispatch(ShutdownRequestedEvent{});
    EXPECT_TRUE(fsm.isShutdown());

    fsm.dispatch(LineReceivedEvent{});
    fsm.dispatch(LineParsedEvent{"echo"});
    fsm.dispatch(CommandCompletedEvent{});
    EXPECT_EQ(fsm.snapshot().state, DispatchState::Shutdown);
    EXPECT_STREQ(dispatchStateName(fsm.snapshot().state), "Shutdown");
}

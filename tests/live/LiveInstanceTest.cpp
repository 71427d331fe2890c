#include <gtest/gtest.h>
#include "env/BasicEnvironment.h"
#include "live/InstanceCast.h"
#include "live/MethodInstance.h"
#include "live/TransitionInstance.h"
#include "mocks/MockStateInstance.h"
#include <memory>

using ::testing::ReturnRef;

namespace SMI {
namespace Tests {

class LiveInstanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        info_ = MachineInfo::Builder("Live")
                    .interfaceEvent("ping", {{"n", "u32"}}, "u32")
                    .state({.name = "Idle", .handlers = {"ping"}})
                    .state({.name = "Busy"})
                    .transition({.id = 0, .event = "ping", .source = "Idle", .target = "Busy"})
                    .transition({.id = 1,
                                 .kind = TransitionKind::ChangeState,
                                 .event = "ping",
                                 .source = "Busy",
                                 .target = "Idle"})
                    .build();
    }

    std::unique_ptr<const MachineInfo> info_;
};

TEST_F(LiveInstanceTest, BasicMethodInstanceReturnValue) {
    auto args = std::make_shared<BasicEnvironment>(BasicEnvironment{{"n", Value{uint32_t{4}}}});
    BasicMethodInstance ping(*info_->getEvent("ping"), args);
    EXPECT_EQ(&ping.getInfo(), info_->getEvent("ping"));
    EXPECT_EQ(ping.getArguments().get<uint32_t>("n"), 4u);
    EXPECT_FALSE(ping.getReturnValue().has_value());

    ping.setReturnValue(Value{uint32_t{8}});
    ASSERT_TRUE(ping.getReturnValue().has_value());
    EXPECT_EQ(valueAs<uint32_t>(*ping.getReturnValue()), 8u);
}

TEST_F(LiveInstanceTest, NullArgumentsBecomeEmpty) {
    BasicMethodInstance ping(*info_->getEvent("ping"), nullptr);
    EXPECT_TRUE(ping.getArguments().getNames().empty());
    EXPECT_EQ(ping.getArgumentsPtr(), Environment::empty());
}

TEST_F(LiveInstanceTest, TransitionToString) {
    auto idle = std::make_shared<BasicStateInstance>(*info_->getState("Idle"));
    auto busy = std::make_shared<BasicStateInstance>(*info_->getState("Busy"));

    TransitionInstance forward(*info_->getTransition(0), idle, busy);
    EXPECT_EQ(forward.getKind(), TransitionKind::Transition);
    EXPECT_EQ(forward.toString(), "Idle->Busy");
    EXPECT_EQ(&forward.getOldState(), idle.get());
    EXPECT_EQ(&forward.getNewState(), busy.get());

    auto back = TransitionInstance::changeState(*info_->getTransition(1), busy, idle);
    EXPECT_EQ(back.getKind(), TransitionKind::ChangeState);
    EXPECT_EQ(back.toString(), "Busy->>Idle");
    EXPECT_TRUE(back.getExitArguments().getNames().empty());
    EXPECT_TRUE(back.getEnterArguments().getNames().empty());
}

// Test that a transition record keeps both states alive
TEST_F(LiveInstanceTest, TransitionSharesStates) {
    std::weak_ptr<StateInstance> weakIdle;
    std::unique_ptr<TransitionInstance> record;
    {
        auto idle = std::make_shared<BasicStateInstance>(*info_->getState("Idle"));
        auto busy = std::make_shared<BasicStateInstance>(*info_->getState("Busy"));
        weakIdle = idle;
        record = std::make_unique<TransitionInstance>(*info_->getTransition(0), idle, busy);
    }
    EXPECT_FALSE(weakIdle.expired());
    EXPECT_EQ(record->getOldState().getInfo().getName(), "Idle");
    record.reset();
    EXPECT_TRUE(weakIdle.expired());
}

TEST_F(LiveInstanceTest, TransitionWithMockStates) {
    MockStateInstance oldState;
    MockStateInstance newState;
    EXPECT_CALL(oldState, getInfo()).WillRepeatedly(ReturnRef(*info_->getState("Idle")));
    EXPECT_CALL(newState, getInfo()).WillRepeatedly(ReturnRef(*info_->getState("Busy")));

    // Non-owning shared_ptrs over stack objects
    std::shared_ptr<const StateInstance> oldPtr(&oldState, [](const StateInstance *) {});
    std::shared_ptr<const StateInstance> newPtr(&newState, [](const StateInstance *) {});

    auto exitArgs = std::make_shared<BasicEnvironment>(BasicEnvironment{{"why", Value{std::string("load")}}});
    TransitionInstance transition(*info_->getTransition(0), oldPtr, newPtr, exitArgs, nullptr);
    EXPECT_EQ(transition.toString(), "Idle->Busy");
    EXPECT_EQ(transition.getExitArguments().get<std::string>("why"), "load");
    EXPECT_TRUE(transition.getEnterArguments().getNames().empty());
}

TEST_F(LiveInstanceTest, TransitionRequiresBothStates) {
    auto idle = std::make_shared<BasicStateInstance>(*info_->getState("Idle"));
    EXPECT_THROW(TransitionInstance(*info_->getTransition(0), idle, nullptr), std::invalid_argument);
}

TEST_F(LiveInstanceTest, InstanceAsCoercion) {
    std::shared_ptr<StateInstance> idle = std::make_shared<BasicStateInstance>(*info_->getState("Idle"));
    EXPECT_EQ(instanceAs<BasicStateInstance>(idle).get(), idle.get());
    EXPECT_EQ(&instanceAs<BasicStateInstance>(*idle), idle.get());
    EXPECT_THROW(instanceAs<MockStateInstance>(idle), ShapeMismatchError);
    EXPECT_THROW(instanceAs<MockStateInstance>(*idle), ShapeMismatchError);

    std::shared_ptr<StateInstance> none;
    EXPECT_EQ(instanceAs<BasicStateInstance>(none), nullptr);

    BasicMethodInstance ping(*info_->getEvent("ping"));
    MethodInstance &base = ping;
    EXPECT_EQ(&instanceAs<BasicMethodInstance>(base), &ping);
}

}  // namespace Tests
}  // namespace SMI

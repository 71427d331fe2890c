#include <gtest/gtest.h>
#include "common/TestUtils.h"
#include "fixtures/state_stack_sm.h"
#include <string>
#include <vector>

namespace SMI {
namespace Tests {

using Generated::state_stack::BState;
using Generated::state_stack::CState;
using Generated::state_stack::State;
using Generated::state_stack::StateStackSm;
using Test::Utils::StreamRecorder;
using Test::Utils::transitionStrings;

using Names = std::vector<std::string>;

class StateStackMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        sm_.getTape().clear();
    }

    int32_t visitsOfCurrent() const {
        return instanceAs<const BState>(sm_.getCurrentStatePtr())->variables.visits;
    }

    uint32_t tagOfCurrent() const {
        return instanceAs<const CState>(sm_.getCurrentStatePtr())->arguments.tag;
    }

    StateStackSm sm_;
};

TEST_F(StateStackMachineTest, PushPop) {
    EXPECT_EQ(sm_.getState(), State::A);
    sm_.push();
    EXPECT_EQ(sm_.getState(), State::A);
    EXPECT_EQ(sm_.getStateStack().size(), 1u);
    EXPECT_TRUE(sm_.getTape().empty());

    sm_.toB();
    EXPECT_EQ(sm_.getState(), State::B);
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::A);
    EXPECT_TRUE(sm_.getStateStack().empty());
    EXPECT_EQ(sm_.getTape(), (Names{"A:<", "B:>", "B:<", "A:>"}));
}

TEST_F(StateStackMachineTest, MultiplePushPops) {
    sm_.push();
    sm_.toC();
    sm_.push();
    sm_.toA();
    sm_.push();
    sm_.push();
    sm_.toC();
    sm_.toB();
    sm_.push();
    sm_.toC();
    sm_.push();
    sm_.toA();
    EXPECT_EQ(sm_.getStateStack().size(), 6u);
    sm_.getTape().clear();

    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::C);
    sm_.toA();
    EXPECT_EQ(sm_.getState(), State::A);
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::B);
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::A);
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::A);
    sm_.toB();
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::C);
    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::A);
    EXPECT_TRUE(sm_.getStateStack().empty());
    EXPECT_EQ(sm_.getTape(), (Names{"A:<", "C:>", "C:<", "A:>", "A:<", "B:>", "B:<", "A:>", "A:<", "A:>", "A:<",
                                    "B:>", "B:<", "C:>", "C:<", "A:>"}));
}

// Test that a popped state is the same instance that was pushed
TEST_F(StateStackMachineTest, PopRestoresVariables) {
    sm_.toB();
    EXPECT_EQ(visitsOfCurrent(), 1);
    auto pushed = sm_.getCurrentStatePtr();
    sm_.push();
    sm_.toA();

    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::B);
    EXPECT_EQ(sm_.getCurrentStatePtr(), pushed);
    // The enter handler ran again on the restored instance
    EXPECT_EQ(visitsOfCurrent(), 2);

    sm_.toA();
    sm_.toB();
    EXPECT_NE(sm_.getCurrentStatePtr(), pushed);
    EXPECT_EQ(visitsOfCurrent(), 1);
}

TEST_F(StateStackMachineTest, PopRestoresArguments) {
    sm_.toC();
    EXPECT_EQ(tagOfCurrent(), 1u);
    sm_.push();
    sm_.toB();
    sm_.toC();
    EXPECT_EQ(tagOfCurrent(), 2u);
    EXPECT_EQ(sm_.getDomainVariables().get<uint32_t>("created"), 2u);

    sm_.pop();
    EXPECT_EQ(sm_.getState(), State::C);
    EXPECT_EQ(tagOfCurrent(), 1u);
    EXPECT_EQ(sm_.getCurrentState().getArguments().get<uint32_t>("tag"), 1u);
    EXPECT_EQ(sm_.getDomainVariables().get<uint32_t>("created"), 1u);
}

TEST_F(StateStackMachineTest, PopTransitionEvents) {
    sm_.getEventMonitor().setTransitionHistoryCapacity(std::nullopt);
    sm_.push();
    sm_.toB();
    sm_.getTape().clear();
    sm_.getEventMonitor().clearTransitionHistory();

    sm_.pop();
    EXPECT_EQ(sm_.getTape(), (Names{"B:<", "A:>"}));
    const auto *last = sm_.getEventMonitor().getLastTransition();
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->getKind(), TransitionKind::Transition);
    EXPECT_EQ(last->getInfo().getId(), 6);
    EXPECT_TRUE(last->getInfo().isStackPop());
    EXPECT_EQ(last->getInfo().getTarget(), nullptr);
    EXPECT_EQ(last->toString(), "B->A");
}

// Test that a change-state pop skips the enter and exit handlers
TEST_F(StateStackMachineTest, PopChangeStateNoEvents) {
    sm_.toB();
    sm_.push();
    sm_.toC();
    sm_.getTape().clear();

    sm_.popChange();
    EXPECT_EQ(sm_.getState(), State::B);
    EXPECT_TRUE(sm_.getTape().empty());
    EXPECT_EQ(visitsOfCurrent(), 1);

    const auto *last = sm_.getEventMonitor().getLastTransition();
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->getKind(), TransitionKind::ChangeState);
    EXPECT_EQ(last->getInfo().getId(), 11);
    EXPECT_EQ(last->toString(), "C->>B");
}

TEST_F(StateStackMachineTest, PopTransitionCallbacks) {
    StreamRecorder recorder(sm_.getEventMonitor());
    sm_.push();
    sm_.toC();
    sm_.push();
    sm_.toB();
    sm_.pop();
    sm_.popChange();
    EXPECT_EQ(recorder.transitions, (Names{"A->C", "C->B", "B->C", "C->>A"}));
}

// Test that popping an empty stack leaves the machine untouched
TEST_F(StateStackMachineTest, PopEmptyStackIsIgnored) {
    StreamRecorder recorder(sm_.getEventMonitor());
    sm_.toB();
    recorder.clear();
    sm_.getTape().clear();

    sm_.pop();
    sm_.popChange();
    EXPECT_EQ(sm_.getState(), State::B);
    EXPECT_TRUE(sm_.getTape().empty());
    EXPECT_TRUE(recorder.transitions.empty());
    EXPECT_EQ(recorder.sent, (Names{"pop", "pop_change"}));
    EXPECT_EQ(recorder.handled, (Names{"pop", "pop_change"}));
}

TEST_F(StateStackMachineTest, PushSharesCurrentInstance) {
    sm_.toC();
    sm_.push();
    EXPECT_EQ(sm_.getStateStack().top(), sm_.getCurrentStatePtr());
    EXPECT_EQ(sm_.getTape().size(), 2u);
}

TEST_F(StateStackMachineTest, DomainVariables) {
    const Environment &domain = sm_.getDomainVariables();
    EXPECT_EQ(domain.getNames(), (Names{"created"}));
    EXPECT_EQ(domain.get<uint32_t>("created"), 0u);
    sm_.toC();
    EXPECT_EQ(domain.get<uint32_t>("created"), 1u);
    sm_.toA();
    sm_.toC();
    EXPECT_EQ(domain.get<uint32_t>("created"), 2u);

    // Declared in the description but not exposed at runtime
    EXPECT_FALSE(domain.contains("tape"));
    EXPECT_EQ(StateStackSm::getMachineInfo().getDomainVariables().size(), 2u);
}

TEST_F(StateStackMachineTest, UnboundedHistories) {
    for (int i = 0; i < 3; ++i) {
        sm_.toB();
        sm_.toA();
    }
    EXPECT_EQ(transitionStrings(sm_.getEventMonitor().getTransitionHistory()).size(), 6u);
    EXPECT_EQ(sm_.getEventMonitor().getEventHistory().size(), 1u + 6u * 3u);
}

}  // namespace Tests
}  // namespace SMI

#include "../../src/internal/execution_state.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace agentbridge;
using namespace agentbridge::internal;
using namespace std::chrono_literals;

namespace
{

ToolCallMessage call(const std::string& id, const std::string& name, json input = json::object())
{
    ToolActivity activity;
    activity.id = id;
    activity.name = name;
    activity.input = std::move(input);
    return ToolCallMessage{activity, json::object()};
}

ToolResultMessage result(const std::string& id, const std::string& content, bool is_error = false)
{
    ToolActivity activity;
    activity.id = id;
    activity.result = content;
    activity.full_result = content;
    activity.is_error = is_error;
    return ToolResultMessage{activity, json::object()};
}

class ControlTrackerTest : public ::testing::Test
{
  protected:
    ClaudeCliBackend backend;
    ExecutionState state;
};

} // namespace

TEST(ExecutionStateMapTest, CreateIsExclusive)
{
    ExecutionStateMap states;
    auto first = states.create("a");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(states.create("a"), nullptr);
    EXPECT_EQ(states.find("a"), first);
    EXPECT_TRUE(states.contains("a"));

    states.create("b");
    EXPECT_EQ(states.size(), 2u);
    EXPECT_EQ(states.ids(), (std::vector<std::string>{"a", "b"}));

    states.erase("a");
    EXPECT_FALSE(states.contains("a"));
    EXPECT_EQ(states.find("a"), nullptr);
}

TEST(ExecutionStateMapTest, StatesAreIsolated)
{
    ExecutionStateMap states;
    auto a = states.create("a");
    auto b = states.create("b");
    a->exit_plan_detected = true;
    EXPECT_FALSE(b->exit_plan_detected);
}

TEST_F(ControlTrackerTest, PlainToolsContinue)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("t1", "Read", {{"file_path", "/a.cpp"}}));
    tracker.observe(result("t1", "contents"));
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::Continue);
}

TEST_F(ControlTrackerTest, QuestionStopsImmediately)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("q", "AskUserQuestion", {{"questions", json::array()}}));
    EXPECT_TRUE(state.ask_question_detected);
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::QuestionPending);
}

TEST_F(ControlTrackerTest, FinishPlanningWaitsForItsOwnResult)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("p", "ExitPlanMode", {{"plan", "1. do it"}}));
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::Continue);

    tracker.observe(result("p", "ok"));
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::PlanReady);
    EXPECT_EQ(tracker.plan_candidate("", nullptr).value_or(""), "1. do it");
}

TEST_F(ControlTrackerTest, FinishPlanningDefersForMarkdownWrite)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("w", "Write", {{"file_path", "/tmp/PLAN.md"}, {"content", "# Plan"}}));
    tracker.observe(call("p", "ExitPlanMode"));
    tracker.observe(result("p", "ok"));
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::Continue);

    tracker.observe(result("w", "written"));
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::PlanReady);
    EXPECT_EQ(tracker.plan_candidate("", nullptr).value_or(""), "# Plan");
}

TEST_F(ControlTrackerTest, GraceExpiresWithWorkInFlight)
{
    ControlTracker tracker(backend, state, 50ms);
    tracker.observe(call("s", "Task", {{"subagent_type", "Plan"}, {"prompt", "plan it"}}));
    tracker.observe(call("p", "ExitPlanMode"));

    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::Continue);
    EXPECT_EQ(tracker.evaluate(Clock::now() + 100ms), StopDecision::PlanGraceExpired);
}

TEST_F(ControlTrackerTest, GraceExpiryWithOnlyFinishPendingIsReady)
{
    ControlTracker tracker(backend, state, 50ms);
    tracker.observe(call("p", "ExitPlanMode"));
    EXPECT_EQ(tracker.evaluate(Clock::now() + 100ms), StopDecision::PlanReady);
}

TEST_F(ControlTrackerTest, RejectedFinishPlanningIsReported)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("p", "ExitPlanMode"));
    tracker.observe(result("p", "User rejected", true));
    EXPECT_TRUE(state.plan_finish_failed);
    EXPECT_EQ(tracker.evaluate(Clock::now()), StopDecision::PlanFinishFailed);
}

TEST_F(ControlTrackerTest, PlanSubtaskResultWins)
{
    ControlTracker tracker(backend, state, 10s);
    tracker.observe(call("s", "Task", {{"subagent_type", "Plan"}}));
    tracker.observe(result("s", "Subtask plan"));
    tracker.observe(call("p", "ExitPlanMode", {{"plan", "Finish plan"}}));

    EXPECT_EQ(tracker.plan_candidate("accumulated", nullptr).value_or(""), "Subtask plan");
}

TEST_F(ControlTrackerTest, PredicateDecidesForPlainText)
{
    ControlTracker tracker(backend, state, 10s);
    auto accepts_numbered = [](const std::string& text) { return text.find("1.") == 0; };

    EXPECT_EQ(tracker.plan_candidate("1. Step", accepts_numbered).value_or(""), "1. Step");
    EXPECT_FALSE(tracker.plan_candidate("Just chatting", accepts_numbered).has_value());
    EXPECT_FALSE(tracker.plan_candidate("1. Step", nullptr).has_value());
}

TEST(StopDecisionTest, Names)
{
    EXPECT_STREQ(to_string(StopDecision::QuestionPending), "question pending");
    EXPECT_STREQ(to_string(StopDecision::PlanReady), "plan ready for approval");
}

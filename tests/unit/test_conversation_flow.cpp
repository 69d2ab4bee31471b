#include <gtest/gtest.h>
#include "flow/conversation_flow_state_machine.hpp"
#include "utils/error_handler.hpp"

using namespace affectrt;
using namespace affectrt::flow;
using emotion::EmotionCategory;

class ConversationFlowTest : public ::testing::Test {
protected:
    session::SessionContext context(FlowPhase phase, float engagement = 0.5f) const {
        session::SessionContext ctx("s1", core::TimePoint(), 10, 20, 10);
        ctx.phase = phase;
        ctx.engagement = engagement;
        ctx.turnNumber = 3;
        return ctx;
    }

    FlowInput input(const std::string& text,
                    EmotionCategory emotion = EmotionCategory::NEUTRAL,
                    crisis::CrisisLevel level = crisis::CrisisLevel::NONE) const {
        FlowInput in;
        in.text = text;
        in.emotion.primaryEmotion = emotion;
        in.crisis.level = level;
        return in;
    }

    // Write the outcome back the way the memory store does
    static void apply(session::SessionContext& ctx, const FlowUpdate& update) {
        ctx.phase = update.phase;
        ctx.engagement = update.engagement;
        ctx.interruptionCount = update.interruptionCount;
        ctx.countdownMs = update.countdownMs;
        ctx.crisisHold = update.crisisHold;
    }

    ConversationFlowStateMachine machine;
};

TEST_F(ConversationFlowTest, GreetingIsAnsweredQuickly) {
    auto ctx = context(FlowPhase::GREETING);
    FlowOutcome outcome = machine.decide(input("Hello there!"), ctx);

    EXPECT_EQ(outcome.decision.action, FlowAction::SPEAK);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::GREETING_MATCHED);
    EXPECT_EQ(outcome.decision.priority, FlowPriority::HIGH);
    // 0.8 x 500 ms is below the floor, so the greeting delay clamps to it
    EXPECT_EQ(outcome.decision.durationMs, 500);
    EXPECT_EQ(outcome.update.phase, FlowPhase::RESPONDING);
}

TEST_F(ConversationFlowTest, CompleteUtteranceStartsProcessing) {
    auto ctx = context(FlowPhase::LISTENING);
    FlowOutcome outcome = machine.decide(input("The bus was late."), ctx);

    EXPECT_EQ(outcome.decision.action, FlowAction::PAUSE);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::UTTERANCE_COMPLETE);
    EXPECT_EQ(outcome.decision.durationMs, 800);
    EXPECT_EQ(outcome.update.phase, FlowPhase::PROCESSING);
    EXPECT_EQ(outcome.update.countdownMs, 800);
}

TEST_F(ConversationFlowTest, NonGreetingInGreetingPhaseIsHeard) {
    auto ctx = context(FlowPhase::GREETING);
    FlowOutcome outcome = machine.decide(input("I need to talk about work."), ctx);

    EXPECT_EQ(outcome.decision.reason, ReasonCode::UTTERANCE_COMPLETE);
    EXPECT_EQ(outcome.update.phase, FlowPhase::PROCESSING);
}

TEST_F(ConversationFlowTest, FragmentKeepsListening) {
    auto ctx = context(FlowPhase::LISTENING);
    FlowOutcome outcome = machine.decide(input("um so"), ctx);

    EXPECT_EQ(outcome.decision.action, FlowAction::LISTEN);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::AWAITING_COMPLETION);
    EXPECT_EQ(outcome.decision.durationMs, 10000);
    EXPECT_EQ(outcome.update.phase, FlowPhase::LISTENING);
}

TEST_F(ConversationFlowTest, CriticalCrisisInterruptsAndHolds) {
    auto ctx = context(FlowPhase::RESPONDING);
    FlowOutcome outcome = machine.decide(
        input("I want to kill myself", EmotionCategory::SADNESS, crisis::CrisisLevel::CRITICAL), ctx);

    EXPECT_EQ(outcome.decision.action, FlowAction::INTERRUPT);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::CRISIS_OVERRIDE);
    EXPECT_EQ(outcome.decision.priority, FlowPriority::HIGH);
    EXPECT_EQ(outcome.decision.durationMs, 0);
    EXPECT_EQ(outcome.update.phase, FlowPhase::PAUSED);
    EXPECT_TRUE(outcome.update.crisisHold);

    apply(ctx, outcome.update);

    // Time, playback completion and silence all leave the hold in place
    EXPECT_EQ(machine.advance(ctx, 60000).decision.reason, ReasonCode::CRISIS_HOLD);
    EXPECT_EQ(machine.completeResponse(ctx).decision.reason, ReasonCode::CRISIS_HOLD);
    EXPECT_EQ(machine.noInput(ctx).decision.reason, ReasonCode::CRISIS_HOLD);
    EXPECT_TRUE(machine.advance(ctx, 60000).update.crisisHold);

    // New input releases it
    FlowOutcome next = machine.decide(input("okay, I'm still here."), ctx);
    EXPECT_FALSE(next.update.crisisHold);
    EXPECT_EQ(next.decision.reason, ReasonCode::UTTERANCE_COMPLETE);
    EXPECT_EQ(next.update.phase, FlowPhase::PROCESSING);
}

TEST_F(ConversationFlowTest, UrgentSignalInterrupts) {
    auto ctx = context(FlowPhase::RESPONDING);
    FlowInput in = input("hmm");
    interruption::IntentionSignals signals;
    signals.urgency = 0.95f;
    in.signals = signals;

    FlowOutcome outcome = machine.decide(in, ctx);
    EXPECT_EQ(outcome.decision.action, FlowAction::INTERRUPT);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::URGENT_PLAYBACK_SIGNAL);
    EXPECT_TRUE(outcome.update.crisisHold);
}

TEST_F(ConversationFlowTest, UrgentKeywordAdmittedUpToCap) {
    auto ctx = context(FlowPhase::RESPONDING, 0.9f);

    FlowOutcome first = machine.decide(input("wait, stop!"), ctx);
    EXPECT_EQ(first.decision.action, FlowAction::INTERRUPT);
    EXPECT_EQ(first.decision.reason, ReasonCode::INTERRUPTION_ADMITTED);
    EXPECT_EQ(first.update.interruptionCount, 1u);
    EXPECT_EQ(first.update.phase, FlowPhase::RESPONDING);

    ctx.interruptionCount = 2;
    FlowOutcome capped = machine.decide(input("wait, stop!"), ctx);
    EXPECT_NE(capped.decision.reason, ReasonCode::INTERRUPTION_ADMITTED);
    EXPECT_EQ(capped.update.interruptionCount, 2u);
}

TEST_F(ConversationFlowTest, UrgentKeywordNeedsEngagement) {
    auto ctx = context(FlowPhase::LISTENING, 0.3f);
    FlowOutcome outcome = machine.decide(input("wait, stop!"), ctx);
    EXPECT_NE(outcome.decision.reason, ReasonCode::INTERRUPTION_ADMITTED);
    EXPECT_EQ(outcome.update.interruptionCount, 0u);
}

TEST_F(ConversationFlowTest, RepeatedDisengagementStrictlyLowersEngagement) {
    auto ctx = context(FlowPhase::LISTENING);
    float previous = ctx.engagement;

    for (int i = 0; i < 5; ++i) {
        FlowOutcome outcome = machine.decide(input("whatever"), ctx);
        EXPECT_LT(outcome.update.engagement, previous) << "turn " << i;
        previous = outcome.update.engagement;
        apply(ctx, outcome.update);
    }
    EXPECT_GE(previous, 0.0f);
}

TEST_F(ConversationFlowTest, EngagementBoosts) {
    EXPECT_NEAR(machine.updateEngagement(0.5f, "Why do you think that is?", EmotionCategory::NEUTRAL),
                0.5f * 0.95f + 0.15f + 0.1f, 1e-5f);
    EXPECT_NEAR(machine.updateEngagement(0.5f, "ok", EmotionCategory::JOY),
                0.5f * 0.95f + 0.2f, 1e-5f);
    EXPECT_NEAR(machine.updateEngagement(0.5f, "I'm so worried", EmotionCategory::NEUTRAL),
                0.5f * 0.95f + 0.2f, 1e-5f);
    EXPECT_FLOAT_EQ(machine.updateEngagement(1.0f, "really? why? tell me more!", EmotionCategory::JOY), 1.0f);
}

TEST_F(ConversationFlowTest, ResponseDelayIsDeterministicAndBounded) {
    const int64_t a = machine.responseDelayMs(DelayContext::DEFAULT, 0.5f, "s1", 4);
    const int64_t b = machine.responseDelayMs(DelayContext::DEFAULT, 0.5f, "s1", 4);
    EXPECT_EQ(a, b);
    EXPECT_GE(a, 500);
    EXPECT_LE(a, 525);

    const int64_t slow = machine.responseDelayMs(DelayContext::DEFAULT, 0.2f, "s1", 4);
    EXPECT_GE(slow, 617);
    EXPECT_LE(slow, 683);

    const int64_t responding = machine.responseDelayMs(DelayContext::RESPONDING, 0.5f, "s2", 1);
    EXPECT_GE(responding, 570);
    EXPECT_LE(responding, 630);

    EXPECT_EQ(machine.responseDelayMs(DelayContext::GREETING, 0.9f, "s1", 1), 500);

    for (uint64_t turn = 0; turn < 50; ++turn) {
        const int64_t delay = machine.responseDelayMs(DelayContext::RESPONDING, 0.1f, "jitter", turn);
        EXPECT_GE(delay, machine.getConfig().minResponseDelayMs);
        EXPECT_LE(delay, machine.getConfig().maxResponseDelayMs);
    }
}

TEST_F(ConversationFlowTest, JitterSeedChangesDelays) {
    FlowConfig seeded;
    seeded.jitterSeed = 12345;
    ConversationFlowStateMachine other(seeded);

    bool differs = false;
    for (uint64_t turn = 0; turn < 20 && !differs; ++turn) {
        differs = machine.responseDelayMs(DelayContext::RESPONDING, 0.5f, "s1", turn) !=
                  other.responseDelayMs(DelayContext::RESPONDING, 0.5f, "s1", turn);
    }
    EXPECT_TRUE(differs);
}

TEST_F(ConversationFlowTest, ProcessingDelayScalesWithWordsAndEmotion) {
    EXPECT_EQ(machine.processingDelayMs("the bus was late", EmotionCategory::NEUTRAL), 800);
    EXPECT_EQ(machine.processingDelayMs("the bus was late", EmotionCategory::ANGER), 1200);
    EXPECT_EQ(machine.processingDelayMs("I am afraid", EmotionCategory::NEUTRAL), 900);
    EXPECT_EQ(machine.processingDelayMs("one two three four five six seven eight nine ten eleven",
                                        EmotionCategory::NEUTRAL), 2000);
    // Whole-word matching: "fearless" is not "fear"
    EXPECT_EQ(machine.processingDelayMs("fearless", EmotionCategory::NEUTRAL), 200);
}

TEST_F(ConversationFlowTest, TransitionDelayFollowsEngagement) {
    EXPECT_EQ(machine.transitionDelayMs(1.0f), 500);
    EXPECT_EQ(machine.transitionDelayMs(0.5f), 750);
    EXPECT_EQ(machine.transitionDelayMs(0.0f), 1000);
}

TEST_F(ConversationFlowTest, ProcessingCountdownLeadsToSpeech) {
    auto ctx = context(FlowPhase::PROCESSING);
    ctx.countdownMs = 1000;

    FlowOutcome waiting = machine.advance(ctx, 400);
    EXPECT_EQ(waiting.decision.action, FlowAction::PAUSE);
    EXPECT_EQ(waiting.decision.reason, ReasonCode::PROCESSING);
    EXPECT_EQ(waiting.decision.durationMs, 600);
    apply(ctx, waiting.update);

    FlowOutcome done = machine.advance(ctx, 600);
    EXPECT_EQ(done.decision.action, FlowAction::SPEAK);
    EXPECT_EQ(done.decision.reason, ReasonCode::PROCESSING_COMPLETE);
    EXPECT_EQ(done.update.phase, FlowPhase::RESPONDING);
    EXPECT_EQ(done.update.countdownMs, 0);
}

TEST_F(ConversationFlowTest, ResponseCompletionTransitionsBackToListening) {
    auto ctx = context(FlowPhase::RESPONDING);

    FlowOutcome complete = machine.completeResponse(ctx);
    EXPECT_EQ(complete.decision.action, FlowAction::TRANSITION);
    EXPECT_EQ(complete.decision.reason, ReasonCode::RESPONSE_COMPLETE);
    EXPECT_EQ(complete.decision.durationMs, 750);
    EXPECT_EQ(complete.update.phase, FlowPhase::TRANSITIONING);
    apply(ctx, complete.update);

    FlowOutcome running = machine.advance(ctx, 300);
    EXPECT_EQ(running.decision.action, FlowAction::TRANSITION);
    EXPECT_EQ(running.decision.reason, ReasonCode::COUNTDOWN_RUNNING);
    EXPECT_EQ(running.decision.durationMs, 450);
    apply(ctx, running.update);

    FlowOutcome elapsed = machine.advance(ctx, 450);
    EXPECT_EQ(elapsed.decision.action, FlowAction::LISTEN);
    EXPECT_EQ(elapsed.decision.reason, ReasonCode::COUNTDOWN_ELAPSED);
    EXPECT_EQ(elapsed.update.phase, FlowPhase::LISTENING);
}

TEST_F(ConversationFlowTest, InputDuringTransitionRespectsCountdown) {
    auto ctx = context(FlowPhase::TRANSITIONING);
    ctx.countdownMs = 700;

    FlowInput early = input("and another thing.");
    early.elapsedMs = 200;
    FlowOutcome waiting = machine.decide(early, ctx);
    EXPECT_EQ(waiting.decision.action, FlowAction::PAUSE);
    EXPECT_EQ(waiting.decision.reason, ReasonCode::COUNTDOWN_RUNNING);
    EXPECT_EQ(waiting.update.countdownMs, 500);

    FlowInput late = input("and another thing.");
    late.elapsedMs = 700;
    FlowOutcome heard = machine.decide(late, ctx);
    EXPECT_EQ(heard.decision.reason, ReasonCode::UTTERANCE_COMPLETE);
}

TEST_F(ConversationFlowTest, AdvanceInIdlePhasesIsQuiet) {
    auto listening = context(FlowPhase::LISTENING);
    FlowOutcome outcome = machine.advance(listening, 5000);
    EXPECT_EQ(outcome.decision.action, FlowAction::LISTEN);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::IDLE);

    auto responding = context(FlowPhase::RESPONDING);
    EXPECT_EQ(machine.advance(responding, 100).decision.action, FlowAction::SPEAK);
}

TEST_F(ConversationFlowTest, BargeInYieldListensAfterDelay) {
    auto ctx = context(FlowPhase::RESPONDING);
    interruption::InterruptionDecision decision;
    decision.shouldYield = true;
    decision.confidence = 0.6f;
    decision.delayMs = 300;
    decision.resumeStrategy = interruption::ResumeStrategy::SUMMARIZE;

    FlowOutcome outcome = machine.onBargeIn(ctx, decision, interruption::IntentionSignals(),
                                            crisis::CrisisAssessment::none());
    EXPECT_EQ(outcome.decision.action, FlowAction::LISTEN);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::BARGE_IN_YIELD);
    EXPECT_EQ(outcome.decision.durationMs, 300);
    EXPECT_EQ(outcome.update.phase, FlowPhase::LISTENING);
}

TEST_F(ConversationFlowTest, BargeInWithoutYieldKeepsSpeaking) {
    auto ctx = context(FlowPhase::RESPONDING);
    FlowOutcome outcome = machine.onBargeIn(ctx, interruption::InterruptionDecision(),
                                            interruption::IntentionSignals(),
                                            crisis::CrisisAssessment::none());
    EXPECT_EQ(outcome.decision.action, FlowAction::SPEAK);
    EXPECT_EQ(outcome.update.phase, FlowPhase::RESPONDING);
}

TEST_F(ConversationFlowTest, BargeInDuringCrisisInterrupts) {
    auto ctx = context(FlowPhase::RESPONDING);
    crisis::CrisisAssessment critical;
    critical.level = crisis::CrisisLevel::CRITICAL;

    FlowOutcome outcome = machine.onBargeIn(ctx, interruption::InterruptionDecision(),
                                            interruption::IntentionSignals(), critical);
    EXPECT_EQ(outcome.decision.action, FlowAction::INTERRUPT);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::CRISIS_OVERRIDE);
    EXPECT_TRUE(outcome.update.crisisHold);
}

TEST_F(ConversationFlowTest, NoInputReturnsToListening) {
    auto ctx = context(FlowPhase::PROCESSING);
    FlowOutcome outcome = machine.noInput(ctx);
    EXPECT_EQ(outcome.decision.action, FlowAction::LISTEN);
    EXPECT_EQ(outcome.decision.reason, ReasonCode::NO_INPUT);
    EXPECT_EQ(outcome.update.phase, FlowPhase::LISTENING);
}

TEST_F(ConversationFlowTest, TextHeuristics) {
    EXPECT_TRUE(machine.isGreeting("Hey!"));
    EXPECT_TRUE(machine.isGreeting("good morning, how's it going"));
    EXPECT_TRUE(machine.isGreeting("How are you doing?"));
    EXPECT_FALSE(machine.isGreeting("they said hello"));
    EXPECT_FALSE(machine.isGreeting("highway traffic"));

    EXPECT_FALSE(machine.looksComplete("ok"));
    EXPECT_TRUE(machine.looksComplete("ok."));
    EXPECT_TRUE(machine.looksComplete("what?"));
    EXPECT_TRUE(machine.looksComplete("this is longer than ten"));
}

TEST_F(ConversationFlowTest, InvalidConfigRejected) {
    FlowConfig config;
    config.minResponseDelayMs = 4000;
    EXPECT_FALSE(config.isValid());
    EXPECT_THROW(ConversationFlowStateMachine{config}, utils::ConfigurationException);
}

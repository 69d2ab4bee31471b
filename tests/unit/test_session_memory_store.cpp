#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "session/session_memory_store.hpp"
#include "utils/error_handler.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace affectrt;
using namespace affectrt::session;
using emotion::EmotionCategory;

namespace {

emotion::EmotionalState stateFor(EmotionCategory category, float intensity = 0.5f) {
    emotion::EmotionalState state;
    emotion::PADTriple pad = emotion::emotion_utils::profileFor(category);
    state.pleasure = pad.pleasure;
    state.arousal = pad.arousal;
    state.dominance = pad.dominance;
    state.primaryEmotion = category;
    state.intensity = intensity;
    return state;
}

} // namespace

class SessionMemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<core::VirtualClock>();
        store = std::make_unique<SessionMemoryStore>(SessionConfig(), clock);
    }

    void TearDown() override {
        store->shutdown();
    }

    std::shared_ptr<core::VirtualClock> clock;
    std::unique_ptr<SessionMemoryStore> store;
};

TEST_F(SessionMemoryStoreTest, GetOrCreateIsLazy) {
    EXPECT_EQ(store->sessionCount(), 0u);
    EXPECT_FALSE(store->find("s1").has_value());
    EXPECT_EQ(store->sessionCount(), 0u);

    SessionContext ctx = store->getOrCreate("s1");
    EXPECT_EQ(ctx.sessionId, "s1");
    EXPECT_EQ(ctx.turnNumber, 0u);
    EXPECT_EQ(ctx.phase, flow::FlowPhase::GREETING);
    EXPECT_FLOAT_EQ(ctx.engagement, 0.5f);
    EXPECT_FALSE(ctx.roleBaseline.has_value());
    EXPECT_EQ(ctx.createdAt, clock->now());

    store->getOrCreate("s1");
    EXPECT_EQ(store->sessionCount(), 1u);
}

TEST_F(SessionMemoryStoreTest, EmptySessionIdRejected) {
    EXPECT_THROW(store->getOrCreate(""), utils::ValidationException);
    EXPECT_THROW(store->record("", stateFor(EmotionCategory::JOY), "hi"), utils::ValidationException);
}

TEST_F(SessionMemoryStoreTest, InvalidConfigRejected) {
    SessionConfig config;
    config.recentEmotionsCapacity = 0;
    EXPECT_THROW(SessionMemoryStore{config}, utils::ConfigurationException);

    SessionConfig alpha;
    alpha.smoothingAlpha = 0.0f;
    EXPECT_THROW(SessionMemoryStore{alpha}, utils::ConfigurationException);
}

TEST_F(SessionMemoryStoreTest, RecordUpdatesBuffersAndBaseline) {
    store->record("s1", stateFor(EmotionCategory::JOY, 0.7f), "I feel great", crisis::CrisisLevel::LOW);

    auto ctx = store->find("s1");
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->turnNumber, 1u);
    ASSERT_EQ(ctx->recentEmotions.size(), 1u);
    EXPECT_EQ(ctx->recentEmotions.back().emotion, EmotionCategory::JOY);
    EXPECT_FLOAT_EQ(ctx->recentEmotions.back().intensity, 0.7f);
    EXPECT_EQ(ctx->conversationHistory.back().excerpt, "I feel great");
    EXPECT_EQ(ctx->crisisHistory.back(), crisis::CrisisLevel::LOW);

    // Exponential smoothing from the neutral baseline with alpha 0.1
    EXPECT_NEAR(ctx->baseline.pleasure, 0.09f, 1e-5f);
    EXPECT_NEAR(ctx->baseline.arousal, 0.52f, 1e-5f);
    EXPECT_NEAR(ctx->baseline.dominance, 0.06f, 1e-5f);

    ASSERT_TRUE(ctx->roleBaseline.has_value());
    EXPECT_FLOAT_EQ(ctx->roleBaseline->pleasure, 0.3f);
}

TEST_F(SessionMemoryStoreTest, BaselineConvergesToRepeatedState) {
    const auto target = emotion::emotion_utils::profileFor(EmotionCategory::SADNESS);
    for (int i = 0; i < 100; ++i) {
        store->record("s1", stateFor(EmotionCategory::SADNESS), "again");
    }

    auto ctx = store->find("s1");
    ASSERT_TRUE(ctx.has_value());
    // 0.9^100 of the initial gap remains
    EXPECT_NEAR(ctx->baseline.pleasure, target.pleasure, 1e-3f);
    EXPECT_NEAR(ctx->baseline.arousal, target.arousal, 1e-3f);
    EXPECT_NEAR(ctx->baseline.dominance, target.dominance, 1e-3f);
    EXPECT_GE(ctx->drift, 0.0f);
}

TEST_F(SessionMemoryStoreTest, RoleBaselineSetOnlyOnce) {
    store->record("s1", stateFor(EmotionCategory::JOY), "one");
    store->record("s1", stateFor(EmotionCategory::SADNESS), "two");

    auto ctx = store->find("s1");
    ASSERT_TRUE(ctx->roleBaseline.has_value());
    EXPECT_FLOAT_EQ(ctx->roleBaseline->pleasure, 0.3f);
    EXPECT_FLOAT_EQ(ctx->roleBaseline->arousal, 0.5f);
}

TEST_F(SessionMemoryStoreTest, RingBuffersStayBounded) {
    for (int i = 0; i < 30; ++i) {
        store->record("s1", stateFor(EmotionCategory::CURIOUS), "turn " + std::to_string(i));
    }

    auto ctx = store->find("s1");
    EXPECT_EQ(ctx->turnNumber, 30u);
    EXPECT_EQ(ctx->recentEmotions.size(), 10u);
    EXPECT_EQ(ctx->conversationHistory.size(), 20u);
    EXPECT_EQ(ctx->crisisHistory.size(), 10u);
    EXPECT_EQ(ctx->conversationHistory[0].excerpt, "turn 10");
    EXPECT_EQ(ctx->conversationHistory.back().excerpt, "turn 29");
}

TEST_F(SessionMemoryStoreTest, ExcerptIsTruncated) {
    store->record("s1", stateFor(EmotionCategory::NEUTRAL), std::string(250, 'x'));
    auto ctx = store->find("s1");
    EXPECT_EQ(ctx->conversationHistory.back().excerpt.size(), 100u);
}

TEST_F(SessionMemoryStoreTest, DriftAboveThresholdNotifies) {
    std::vector<std::pair<std::string, float>> notified;
    store->setDriftCallback([&notified](const std::string& id, float drift) {
        notified.emplace_back(id, drift);
    });

    store->record("s1", stateFor(EmotionCategory::NEUTRAL), "hello");
    EXPECT_TRUE(notified.empty());

    // Fear sits far from the smoothed neutral baseline
    store->record("s1", stateFor(EmotionCategory::FEAR), "something is wrong");

    auto ctx = store->find("s1");
    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0].first, "s1");
    EXPECT_FLOAT_EQ(notified[0].second, ctx->drift);
    EXPECT_GT(ctx->drift, 0.3f);
}

TEST_F(SessionMemoryStoreTest, ThrowingDriftCallbackDoesNotFailRecord) {
    store->setDriftCallback([](const std::string&, float) {
        throw std::runtime_error("listener failed");
    });

    EXPECT_NO_THROW(store->record("s1", stateFor(EmotionCategory::FEAR), "help"));
    EXPECT_EQ(store->find("s1")->turnNumber, 1u);
}

TEST_F(SessionMemoryStoreTest, StableSessionHasLowDrift) {
    for (int i = 0; i < 5; ++i) {
        store->record("s1", stateFor(EmotionCategory::NEUTRAL), "fine");
    }
    auto ctx = store->find("s1");
    EXPECT_NEAR(ctx->drift, 0.0f, 1e-5f);
    EXPECT_NEAR(ctx->emotionalStability, 1.0f, 1e-5f);
}

TEST_F(SessionMemoryStoreTest, RelationshipProgresses) {
    for (int i = 0; i < 6; ++i) {
        store->record("s1", stateFor(EmotionCategory::JOY, 0.8f), "hi");
    }
    auto ctx = store->find("s1");
    EXPECT_EQ(ctx->relationshipStage, RelationshipStage::BUILDING);
    EXPECT_NEAR(ctx->trustLevel, 0.3f + 6 * 0.05f, 1e-5f);
    EXPECT_FLOAT_EQ(ctx->comfortLevel, 0.3f);
}

TEST_F(SessionMemoryStoreTest, SnapshotsAreCopies) {
    SessionContext snapshot = store->getOrCreate("s1");
    snapshot.turnNumber = 99;
    snapshot.engagement = 0.0f;

    auto fresh = store->find("s1");
    EXPECT_EQ(fresh->turnNumber, 0u);
    EXPECT_FLOAT_EQ(fresh->engagement, 0.5f);
}

TEST_F(SessionMemoryStoreTest, ApplyFlowWritesBackClamped) {
    flow::FlowUpdate update;
    update.phase = flow::FlowPhase::PROCESSING;
    update.engagement = 1.7f;
    update.interruptionCount = 2;
    update.countdownMs = -50;
    update.crisisHold = true;
    store->applyFlow("s1", update);

    auto ctx = store->find("s1");
    EXPECT_EQ(ctx->phase, flow::FlowPhase::PROCESSING);
    EXPECT_FLOAT_EQ(ctx->engagement, 1.0f);
    EXPECT_EQ(ctx->interruptionCount, 2u);
    EXPECT_EQ(ctx->countdownMs, 0);
    EXPECT_TRUE(ctx->crisisHold);
    EXPECT_EQ(ctx->turnNumber, 0u);
}

TEST_F(SessionMemoryStoreTest, SweepRemovesOnlyIdleSessions) {
    store->getOrCreate("idle");
    clock->advance(core::Milliseconds(20 * 60 * 1000));
    store->getOrCreate("active");
    store->record("active", stateFor(EmotionCategory::JOY), "still here");

    // Exactly at the timeout the idle session survives
    clock->advance(core::Milliseconds(10 * 60 * 1000));
    EXPECT_EQ(store->sweepExpired(clock->now()), 0u);

    clock->advance(core::Milliseconds(1));
    EXPECT_EQ(store->sweepExpired(clock->now()), 1u);
    EXPECT_FALSE(store->find("idle").has_value());
    EXPECT_TRUE(store->find("active").has_value());

    // Repeated sweeps are no-ops
    EXPECT_EQ(store->sweepExpired(clock->now()), 0u);
}

TEST_F(SessionMemoryStoreTest, SnapshotKeepsSessionAliveAcrossSweep) {
    store->record("s1", stateFor(EmotionCategory::SADNESS), "first turn");
    store->record("s1", stateFor(EmotionCategory::SADNESS), "second turn");

    // A new turn takes its snapshot just before the idle timeout
    clock->advance(core::Milliseconds(30 * 60 * 1000 - 10));
    SessionContext snapshot = store->getOrCreate("s1");
    EXPECT_EQ(snapshot.turnNumber, 2u);

    // and the sweep runs while that turn is still being processed
    clock->advance(core::Milliseconds(20));
    EXPECT_EQ(store->sweepExpired(clock->now()), 0u);

    store->record("s1", stateFor(EmotionCategory::SADNESS), "third turn");
    auto ctx = store->find("s1");
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->turnNumber, 3u);
    EXPECT_EQ(ctx->recentEmotions.size(), 3u);
}

TEST_F(SessionMemoryStoreTest, PeriodicSweepOnScheduler) {
    core::VirtualScheduler scheduler(clock);
    store->init(scheduler);
    EXPECT_TRUE(store->isInitialized());

    store->getOrCreate("s1");
    scheduler.advance(core::Milliseconds(30 * 60 * 1000));
    EXPECT_EQ(store->sessionCount(), 1u);

    scheduler.advance(core::Milliseconds(60 * 1000));
    EXPECT_EQ(store->sessionCount(), 0u);

    store->shutdown();
    EXPECT_FALSE(store->isInitialized());
    EXPECT_EQ(scheduler.pendingCount(), 0u);
}

TEST_F(SessionMemoryStoreTest, EndSession) {
    store->getOrCreate("s1");
    EXPECT_TRUE(store->endSession("s1"));
    EXPECT_FALSE(store->endSession("s1"));
    EXPECT_EQ(store->sessionCount(), 0u);
}

TEST_F(SessionMemoryStoreTest, ShutdownDropsSessions) {
    store->getOrCreate("a");
    store->getOrCreate("b");
    store->shutdown();
    EXPECT_EQ(store->sessionCount(), 0u);
}

TEST_F(SessionMemoryStoreTest, ConcurrentRecordsAreNotLost) {
    constexpr int kThreads = 8;
    constexpr int kTurns = 100;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kTurns; ++i) {
                store->record("shared", stateFor(EmotionCategory::JOY), "x");
                store->record("own" + std::to_string(t), stateFor(EmotionCategory::SADNESS), "y");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store->find("shared")->turnNumber, static_cast<uint64_t>(kThreads * kTurns));
    EXPECT_EQ(store->sessionCount(), static_cast<size_t>(kThreads + 1));
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(store->find("own" + std::to_string(t))->turnNumber, static_cast<uint64_t>(kTurns));
    }
}

#pragma once

#include "core/scheduler.hpp"
#include "crisis/crisis_types.hpp"
#include "emotion/emotion_types.hpp"
#include "flow/flow_types.hpp"
#include "session/ring_buffer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace affectrt {
namespace session {

enum class RelationshipStage {
    NEW,
    BUILDING,
    ESTABLISHED,
    CLOSE
};

std::string toString(RelationshipStage stage);

struct EmotionRecord {
    emotion::EmotionCategory emotion = emotion::EmotionCategory::NEUTRAL;
    float intensity = 0.0f;
    emotion::PADTriple pad;
    core::TimePoint timestamp;
};

struct HistoryEntry {
    std::string excerpt;
    emotion::EmotionCategory emotion = emotion::EmotionCategory::NEUTRAL;
    core::TimePoint timestamp;
};

/**
 * Per-session memory. Owned by SessionMemoryStore; every other component
 * only ever sees a snapshot copy for the duration of one call.
 */
struct SessionContext {
    SessionContext(const std::string& id, core::TimePoint now,
                   size_t emotionCapacity, size_t historyCapacity, size_t crisisCapacity);

    std::string sessionId;
    core::TimePoint createdAt;
    core::TimePoint lastActivity;
    uint64_t turnNumber = 0;

    RingBuffer<EmotionRecord> recentEmotions;
    RingBuffer<HistoryEntry> conversationHistory;
    RingBuffer<crisis::CrisisLevel> crisisHistory;

    emotion::PADTriple baseline;
    std::optional<emotion::PADTriple> roleBaseline;
    float drift = 0.0f;
    float emotionalStability = 1.0f;

    // Flow state
    flow::FlowPhase phase = flow::FlowPhase::GREETING;
    float engagement = 0.5f;
    uint32_t interruptionCount = 0;
    int64_t countdownMs = 0;
    bool crisisHold = false;

    // Relationship memory for prompt context
    RelationshipStage relationshipStage = RelationshipStage::NEW;
    float trustLevel = 0.3f;
    float comfortLevel = 0.3f;
};

} // namespace session
} // namespace affectrt

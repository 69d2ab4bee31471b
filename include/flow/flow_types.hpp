#pragma once

#include <cstdint>
#include <string>

namespace affectrt {
namespace flow {

enum class FlowPhase {
    GREETING,
    LISTENING,
    PROCESSING,
    RESPONDING,
    TRANSITIONING,
    PAUSED
};

enum class FlowAction {
    SPEAK,
    LISTEN,
    PAUSE,
    TRANSITION,
    INTERRUPT
};

enum class FlowPriority {
    LOW,
    MEDIUM,
    HIGH
};

/**
 * Every path through the state machine has its own code
 */
enum class ReasonCode {
    CRISIS_OVERRIDE,
    URGENT_PLAYBACK_SIGNAL,
    CRISIS_HOLD,
    INTERRUPTION_ADMITTED,
    BARGE_IN_YIELD,
    GREETING_MATCHED,
    UTTERANCE_COMPLETE,
    AWAITING_COMPLETION,
    PROCESSING,
    PROCESSING_COMPLETE,
    RESPONDING,
    RESPONSE_COMPLETE,
    COUNTDOWN_RUNNING,
    COUNTDOWN_ELAPSED,
    NO_INPUT,
    IDLE,
    FALLBACK
};

struct FlowDecision {
    FlowAction action = FlowAction::LISTEN;
    int64_t durationMs = 0;
    FlowPriority priority = FlowPriority::MEDIUM;
    ReasonCode reason = ReasonCode::IDLE;

    /**
     * Pipeline fallback when the flow stage faults
     */
    static FlowDecision fallback();
};

/**
 * Flow-owned fields of a session, written back through the memory store
 */
struct FlowUpdate {
    FlowPhase phase = FlowPhase::GREETING;
    float engagement = 0.5f;
    uint32_t interruptionCount = 0;
    int64_t countdownMs = 0;
    bool crisisHold = false;
};

namespace flow_utils {

std::string toString(FlowPhase phase);
std::string toString(FlowAction action);
std::string toString(FlowPriority priority);
std::string toString(ReasonCode reason);

} // namespace flow_utils

} // namespace flow
} // namespace affectrt

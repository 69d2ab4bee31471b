#include "flow/flow_types.hpp"

namespace affectrt {
namespace flow {

FlowDecision FlowDecision::fallback() {
    FlowDecision decision;
    decision.action = FlowAction::LISTEN;
    decision.durationMs = 0;
    decision.priority = FlowPriority::MEDIUM;
    decision.reason = ReasonCode::FALLBACK;
    return decision;
}

namespace flow_utils {

std::string toString(FlowPhase phase) {
    switch (phase) {
        case FlowPhase::GREETING: return "greeting";
        case FlowPhase::LISTENING: return "listening";
        case FlowPhase::PROCESSING: return "processing";
        case FlowPhase::RESPONDING: return "responding";
        case FlowPhase::TRANSITIONING: return "transitioning";
        case FlowPhase::PAUSED: return "paused";
    }
    return "listening";
}

std::string toString(FlowAction action) {
    switch (action) {
        case FlowAction::SPEAK: return "speak";
        case FlowAction::LISTEN: return "listen";
        case FlowAction::PAUSE: return "pause";
        case FlowAction::TRANSITION: return "transition";
        case FlowAction::INTERRUPT: return "interrupt";
    }
    return "listen";
}

std::string toString(FlowPriority priority) {
    switch (priority) {
        case FlowPriority::LOW: return "low";
        case FlowPriority::MEDIUM: return "medium";
        case FlowPriority::HIGH: return "high";
    }
    return "medium";
}

std::string toString(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::CRISIS_OVERRIDE: return "CRISIS_OVERRIDE";
        case ReasonCode::URGENT_PLAYBACK_SIGNAL: return "URGENT_PLAYBACK_SIGNAL";
        case ReasonCode::CRISIS_HOLD: return "CRISIS_HOLD";
        case ReasonCode::INTERRUPTION_ADMITTED: return "INTERRUPTION_ADMITTED";
        case ReasonCode::BARGE_IN_YIELD: return "BARGE_IN_YIELD";
        case ReasonCode::GREETING_MATCHED: return "GREETING_MATCHED";
        case ReasonCode::UTTERANCE_COMPLETE: return "UTTERANCE_COMPLETE";
        case ReasonCode::AWAITING_COMPLETION: return "AWAITING_COMPLETION";
        case ReasonCode::PROCESSING: return "PROCESSING";
        case ReasonCode::PROCESSING_COMPLETE: return "PROCESSING_COMPLETE";
        case ReasonCode::RESPONDING: return "RESPONDING";
        case ReasonCode::RESPONSE_COMPLETE: return "RESPONSE_COMPLETE";
        case ReasonCode::COUNTDOWN_RUNNING: return "COUNTDOWN_RUNNING";
        case ReasonCode::COUNTDOWN_ELAPSED: return "COUNTDOWN_ELAPSED";
        case ReasonCode::NO_INPUT: return "NO_INPUT";
        case ReasonCode::IDLE: return "IDLE";
        case ReasonCode::FALLBACK: return "FALLBACK";
    }
    return "IDLE";
}

} // namespace flow_utils

} // namespace flow
} // namespace affectrt

#include "flow/conversation_flow_state_machine.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace affectrt {
namespace flow {

namespace {

const std::vector<std::string>& greetingPrefixes() {
    static const std::vector<std::string> prefixes = {
        "hi", "hello", "hey", "good morning", "good afternoon", "good evening", "how are you"};
    return prefixes;
}

const std::vector<std::string>& emotionalKeywords() {
    static const std::vector<std::string> words = {
        "love", "hate", "sad", "happy", "angry", "scared", "excited", "worried"};
    return words;
}

const std::vector<std::string>& complexEmotionKeywords() {
    static const std::vector<std::string> words = {
        "sad", "sadness", "angry", "anger", "anxious", "anxiety",
        "fear", "afraid", "surprise", "surprised"};
    return words;
}

FlowUpdate updateFrom(const session::SessionContext& context) {
    FlowUpdate update;
    update.phase = context.phase;
    update.engagement = context.engagement;
    update.interruptionCount = context.interruptionCount;
    update.countdownMs = context.countdownMs;
    update.crisisHold = context.crisisHold;
    return update;
}

FlowDecision makeDecision(FlowAction action, int64_t durationMs, FlowPriority priority, ReasonCode reason) {
    FlowDecision decision;
    decision.action = action;
    decision.durationMs = std::max<int64_t>(0, durationMs);
    decision.priority = priority;
    decision.reason = reason;
    return decision;
}

FlowOutcome crisisHoldOutcome(const FlowUpdate& update) {
    return FlowOutcome{makeDecision(FlowAction::PAUSE, 0, FlowPriority::HIGH, ReasonCode::CRISIS_HOLD), update};
}

// FNV-1a, stable across platforms so jitter is reproducible
uint64_t fnv1a(const std::string& data, uint64_t seed) {
    uint64_t hash = 1469598103934665603ULL ^ seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

bool FlowConfig::isValid() const {
    return minResponseDelayMs >= 0 && minResponseDelayMs <= maxResponseDelayMs &&
           engagementDecay > 0.0f && engagementDecay <= 1.0f &&
           disengagementDamping >= 0.0f && disengagementDamping < 1.0f &&
           jitter >= 0.0f && jitter < 1.0f &&
           msPerWord >= 0 && maxProcessingMs >= 0 && transitionBaseMs >= 0;
}

ConversationFlowStateMachine::ConversationFlowStateMachine(const FlowConfig& config) : config_(config) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid flow configuration",
                                            "min delay " + std::to_string(config_.minResponseDelayMs) +
                                            ", max delay " + std::to_string(config_.maxResponseDelayMs));
    }
}

const std::vector<std::string>& ConversationFlowStateMachine::engagementKeywords() {
    static const std::vector<std::string> words = {
        "really", "interesting", "tell me more", "what do you think",
        "how", "why", "when", "where", "who", "what"};
    return words;
}

const std::vector<std::string>& ConversationFlowStateMachine::disengagementKeywords() {
    static const std::vector<std::string> words = {
        "whatever", "i don't care", "not interested", "boring",
        "stop talking", "shut up", "leave me alone"};
    return words;
}

const std::vector<std::string>& ConversationFlowStateMachine::urgentKeywords() {
    static const std::vector<std::string> words = {"help", "emergency", "urgent", "stop", "wait", "no"};
    return words;
}

bool ConversationFlowStateMachine::isGreeting(const std::string& text) const {
    const std::string normalized = utils::text::normalize(text);
    for (const auto& prefix : greetingPrefixes()) {
        const std::string pattern = utils::text::normalize(prefix);
        if (normalized.compare(0, pattern.size(), pattern) == 0) {
            return true;
        }
    }
    return false;
}

bool ConversationFlowStateMachine::looksComplete(const std::string& text) const {
    const std::string trimmed = utils::text::trim(text);
    return utils::text::endsWithTerminalPunctuation(trimmed) ||
           trimmed.find('?') != std::string::npos ||
           trimmed.size() > config_.completeLengthThreshold;
}

bool ConversationFlowStateMachine::hasUrgentKeyword(const std::string& normalizedText) const {
    return utils::text::countPhrases(normalizedText, urgentKeywords()) > 0;
}

bool ConversationFlowStateMachine::hasEmotionalContent(const std::string& normalizedText,
                                                       emotion::EmotionCategory emotion) const {
    return emotion != emotion::EmotionCategory::NEUTRAL ||
           utils::text::countPhrases(normalizedText, emotionalKeywords()) > 0;
}

float ConversationFlowStateMachine::updateEngagement(float current, const std::string& text,
                                                     emotion::EmotionCategory emotion) const {
    const std::string normalized = utils::text::normalize(text);
    float engagement = current * config_.engagementDecay;

    if (hasEmotionalContent(normalized, emotion)) {
        engagement += config_.emotionalBoost;
    }
    if (text.find('?') != std::string::npos) {
        engagement += config_.questionBoost;
    }
    if (utils::text::countPhrases(normalized, engagementKeywords()) > 0) {
        engagement += config_.engagementKeywordBoost;
    }
    // Multiplicative, so repeated disengagement keeps lowering engagement
    if (utils::text::countPhrases(normalized, disengagementKeywords()) > 0) {
        engagement *= config_.disengagementDamping;
    }

    if (!std::isfinite(engagement)) {
        return 0.0f;
    }
    return std::clamp(engagement, 0.0f, 1.0f);
}

float ConversationFlowStateMachine::jitterFactor(const std::string& sessionId, uint64_t turnNumber) const {
    const uint64_t hash = fnv1a(sessionId + "#" + std::to_string(turnNumber), config_.jitterSeed);
    // Map to [-1, 1]
    const double unit = static_cast<double>(hash % 20001ULL) / 10000.0 - 1.0;
    return 1.0f + config_.jitter * static_cast<float>(unit);
}

int64_t ConversationFlowStateMachine::responseDelayMs(DelayContext delayContext, float engagement,
                                                      const std::string& sessionId,
                                                      uint64_t turnNumber) const {
    double delay = static_cast<double>(config_.minResponseDelayMs);
    switch (delayContext) {
        case DelayContext::GREETING:
            delay *= config_.greetingDelayFactor;
            break;
        case DelayContext::RESPONDING:
            delay *= config_.respondingDelayFactor;
            break;
        case DelayContext::DEFAULT:
            break;
    }

    if (engagement > config_.highEngagement) {
        delay *= config_.highEngagementFactor;
    } else if (engagement < config_.lowEngagement) {
        delay *= config_.lowEngagementFactor;
    }

    delay *= jitterFactor(sessionId, turnNumber);

    const auto rounded = static_cast<int64_t>(std::llround(delay));
    return std::clamp(rounded, config_.minResponseDelayMs, config_.maxResponseDelayMs);
}

int64_t ConversationFlowStateMachine::processingDelayMs(const std::string& text,
                                                        emotion::EmotionCategory emotion) const {
    const std::string normalized = utils::text::normalize(text);
    double delay = static_cast<double>(utils::text::countWords(text)) * static_cast<double>(config_.msPerWord);
    if (emotion != emotion::EmotionCategory::NEUTRAL ||
        utils::text::countPhrases(normalized, complexEmotionKeywords()) > 0) {
        delay *= config_.emotionalComplexityFactor;
    }
    return std::min(config_.maxProcessingMs, static_cast<int64_t>(std::llround(delay)));
}

int64_t ConversationFlowStateMachine::transitionDelayMs(float engagement) const {
    const float clamped = std::clamp(engagement, 0.0f, 1.0f);
    return static_cast<int64_t>(std::llround(config_.transitionBaseMs * (2.0f - clamped)));
}

FlowOutcome ConversationFlowStateMachine::decide(const FlowInput& input,
                                                 const session::SessionContext& context) const {
    FlowUpdate update = updateFrom(context);
    update.engagement = updateEngagement(context.engagement, input.text, input.emotion.primaryEmotion);

    // Crisis or an overwhelming intention signal overrides everything else
    const bool critical = input.crisis.level == crisis::CrisisLevel::CRITICAL;
    const bool urgentSignal = input.signals && input.signals->urgency > config_.urgentSignalThreshold;
    if (critical || urgentSignal) {
        update.phase = FlowPhase::PAUSED;
        update.countdownMs = 0;
        update.crisisHold = true;
        utils::Logger::warn("Flow interrupt for session " + context.sessionId +
                            (critical ? ": critical crisis, holding until new input"
                                      : ": urgent playback signal, holding until new input"));
        return FlowOutcome{makeDecision(FlowAction::INTERRUPT, 0, FlowPriority::HIGH,
                                        critical ? ReasonCode::CRISIS_OVERRIDE
                                                 : ReasonCode::URGENT_PLAYBACK_SIGNAL),
                           update};
    }

    const std::string normalized = utils::text::normalize(input.text);
    if (hasUrgentKeyword(normalized) &&
        update.engagement > config_.interruptionEngagementThreshold &&
        update.interruptionCount < config_.interruptionCountCap) {
        update.interruptionCount += 1;
        update.phase = FlowPhase::RESPONDING;
        update.countdownMs = 0;
        update.crisisHold = false;
        return FlowOutcome{makeDecision(FlowAction::INTERRUPT, 0, FlowPriority::HIGH,
                                        ReasonCode::INTERRUPTION_ADMITTED),
                           update};
    }

    FlowPhase phase = context.phase;
    if (update.crisisHold) {
        // New input is the only thing that releases a hold
        utils::Logger::info("Crisis hold released by new input for session " + context.sessionId);
        update.crisisHold = false;
        update.countdownMs = 0;
        phase = FlowPhase::LISTENING;
    }
    return decideForPhase(phase, input, context, update);
}

FlowOutcome ConversationFlowStateMachine::decideForPhase(FlowPhase phase, const FlowInput& input,
                                                         const session::SessionContext& context,
                                                         FlowUpdate update) const {
    const uint64_t turn = context.turnNumber + 1;

    switch (phase) {
        case FlowPhase::GREETING:
            if (isGreeting(input.text)) {
                update.phase = FlowPhase::RESPONDING;
                update.countdownMs = 0;
                return FlowOutcome{makeDecision(FlowAction::SPEAK,
                                                responseDelayMs(DelayContext::GREETING, update.engagement,
                                                                context.sessionId, turn),
                                                FlowPriority::HIGH, ReasonCode::GREETING_MATCHED),
                                   update};
            }
            return listen(input, context, update);

        case FlowPhase::LISTENING:
            return listen(input, context, update);

        case FlowPhase::PROCESSING: {
            const int64_t delay = processingDelayMs(input.text, input.emotion.primaryEmotion);
            update.phase = FlowPhase::PROCESSING;
            update.countdownMs = delay;
            return FlowOutcome{makeDecision(FlowAction::PAUSE, delay, FlowPriority::MEDIUM,
                                            ReasonCode::PROCESSING),
                               update};
        }

        case FlowPhase::RESPONDING:
            update.phase = FlowPhase::RESPONDING;
            return FlowOutcome{makeDecision(FlowAction::SPEAK,
                                            responseDelayMs(DelayContext::RESPONDING, update.engagement,
                                                            context.sessionId, turn),
                                            FlowPriority::MEDIUM, ReasonCode::RESPONDING),
                               update};

        case FlowPhase::TRANSITIONING:
        case FlowPhase::PAUSED: {
            const int64_t remaining = update.countdownMs - std::max<int64_t>(0, input.elapsedMs);
            if (remaining > 0) {
                update.countdownMs = remaining;
                return FlowOutcome{makeDecision(FlowAction::PAUSE, remaining, FlowPriority::LOW,
                                                ReasonCode::COUNTDOWN_RUNNING),
                                   update};
            }
            update.countdownMs = 0;
            return listen(input, context, update);
        }
    }
    throw utils::FlowException("Unhandled flow phase", flow_utils::toString(phase));
}

FlowOutcome ConversationFlowStateMachine::listen(const FlowInput& input,
                                                 const session::SessionContext& context,
                                                 FlowUpdate update) const {
    if (looksComplete(input.text)) {
        const int64_t delay = processingDelayMs(input.text, input.emotion.primaryEmotion);
        update.phase = FlowPhase::PROCESSING;
        update.countdownMs = delay;
        utils::Logger::debug("Utterance complete for " + context.sessionId + ", processing for " +
                             std::to_string(delay) + "ms");
        return FlowOutcome{makeDecision(FlowAction::PAUSE, delay, FlowPriority::MEDIUM,
                                        ReasonCode::UTTERANCE_COMPLETE),
                           update};
    }
    update.phase = FlowPhase::LISTENING;
    update.countdownMs = 0;
    return FlowOutcome{makeDecision(FlowAction::LISTEN, config_.turnTimeoutMs, FlowPriority::LOW,
                                    ReasonCode::AWAITING_COMPLETION),
                       update};
}

FlowOutcome ConversationFlowStateMachine::advance(const session::SessionContext& context,
                                                  int64_t elapsedMs) const {
    FlowUpdate update = updateFrom(context);
    if (update.crisisHold) {
        return crisisHoldOutcome(update);
    }

    const int64_t elapsed = std::max<int64_t>(0, elapsedMs);
    switch (context.phase) {
        case FlowPhase::PROCESSING: {
            const int64_t remaining = update.countdownMs - elapsed;
            if (remaining > 0) {
                update.countdownMs = remaining;
                return FlowOutcome{makeDecision(FlowAction::PAUSE, remaining, FlowPriority::MEDIUM,
                                                ReasonCode::PROCESSING),
                                   update};
            }
            update.countdownMs = 0;
            update.phase = FlowPhase::RESPONDING;
            return FlowOutcome{makeDecision(FlowAction::SPEAK,
                                            responseDelayMs(DelayContext::RESPONDING, update.engagement,
                                                            context.sessionId, context.turnNumber),
                                            FlowPriority::MEDIUM, ReasonCode::PROCESSING_COMPLETE),
                               update};
        }
        case FlowPhase::TRANSITIONING:
        case FlowPhase::PAUSED: {
            const int64_t remaining = update.countdownMs - elapsed;
            if (remaining > 0) {
                update.countdownMs = remaining;
                const FlowAction action = context.phase == FlowPhase::TRANSITIONING
                                              ? FlowAction::TRANSITION
                                              : FlowAction::PAUSE;
                return FlowOutcome{makeDecision(action, remaining, FlowPriority::LOW,
                                                ReasonCode::COUNTDOWN_RUNNING),
                                   update};
            }
            update.countdownMs = 0;
            update.phase = FlowPhase::LISTENING;
            return FlowOutcome{makeDecision(FlowAction::LISTEN, config_.turnTimeoutMs, FlowPriority::LOW,
                                            ReasonCode::COUNTDOWN_ELAPSED),
                               update};
        }
        case FlowPhase::RESPONDING:
            return FlowOutcome{makeDecision(FlowAction::SPEAK, 0, FlowPriority::MEDIUM,
                                            ReasonCode::RESPONDING),
                               update};
        case FlowPhase::GREETING:
        case FlowPhase::LISTENING:
        default:
            return FlowOutcome{makeDecision(FlowAction::LISTEN, 0, FlowPriority::LOW, ReasonCode::IDLE),
                               update};
    }
}

FlowOutcome ConversationFlowStateMachine::completeResponse(const session::SessionContext& context) const {
    FlowUpdate update = updateFrom(context);
    if (update.crisisHold) {
        return crisisHoldOutcome(update);
    }
    const int64_t transition = transitionDelayMs(update.engagement);
    update.phase = FlowPhase::TRANSITIONING;
    update.countdownMs = transition;
    return FlowOutcome{makeDecision(FlowAction::TRANSITION, transition, FlowPriority::LOW,
                                    ReasonCode::RESPONSE_COMPLETE),
                       update};
}

FlowOutcome ConversationFlowStateMachine::onBargeIn(const session::SessionContext& context,
                                                    const interruption::InterruptionDecision& decision,
                                                    const interruption::IntentionSignals& signals,
                                                    const crisis::CrisisAssessment& crisis) const {
    FlowUpdate update = updateFrom(context);
    const bool critical = crisis.level == crisis::CrisisLevel::CRITICAL;
    const bool urgentSignal = signals.urgency > config_.urgentSignalThreshold;

    if (critical || urgentSignal) {
        update.phase = FlowPhase::PAUSED;
        update.countdownMs = 0;
        update.crisisHold = true;
        return FlowOutcome{makeDecision(FlowAction::INTERRUPT, 0, FlowPriority::HIGH,
                                        critical ? ReasonCode::CRISIS_OVERRIDE
                                                 : ReasonCode::URGENT_PLAYBACK_SIGNAL),
                           update};
    }
    if (update.crisisHold) {
        return crisisHoldOutcome(update);
    }
    if (decision.shouldYield) {
        update.phase = FlowPhase::LISTENING;
        update.countdownMs = 0;
        std::ostringstream oss;
        oss << "Yielding floor to user in session " << context.sessionId << " after "
            << decision.delayMs << "ms (confidence " << decision.confidence << ")";
        utils::Logger::info(oss.str());
        return FlowOutcome{makeDecision(FlowAction::LISTEN, decision.delayMs, FlowPriority::HIGH,
                                        ReasonCode::BARGE_IN_YIELD),
                           update};
    }
    return FlowOutcome{makeDecision(FlowAction::SPEAK, 0, FlowPriority::MEDIUM, ReasonCode::RESPONDING),
                       update};
}

FlowOutcome ConversationFlowStateMachine::noInput(const session::SessionContext& context) const {
    FlowUpdate update = updateFrom(context);
    if (update.crisisHold) {
        return crisisHoldOutcome(update);
    }
    update.phase = FlowPhase::LISTENING;
    update.countdownMs = 0;
    return FlowOutcome{makeDecision(FlowAction::LISTEN, config_.turnTimeoutMs, FlowPriority::LOW,
                                    ReasonCode::NO_INPUT),
                       update};
}

} // namespace flow
} // namespace affectrt

#pragma once

#include "crisis/crisis_types.hpp"
#include "emotion/emotion_types.hpp"
#include "flow/flow_types.hpp"
#include "interruption/interruption_types.hpp"
#include "session/session_context.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace affectrt {
namespace flow {

/**
 * Turn-taking constants
 */
struct FlowConfig {
    int64_t minResponseDelayMs = 500;
    int64_t maxResponseDelayMs = 3000;
    uint32_t interruptionCountCap = 2;
    float interruptionEngagementThreshold = 0.7f;
    float urgentSignalThreshold = 0.9f;

    float engagementDecay = 0.95f;
    float emotionalBoost = 0.2f;
    float questionBoost = 0.15f;
    float engagementKeywordBoost = 0.1f;
    float disengagementDamping = 0.6f;

    float greetingDelayFactor = 0.8f;
    float respondingDelayFactor = 1.2f;
    float highEngagement = 0.8f;
    float highEngagementFactor = 0.8f;
    float lowEngagement = 0.3f;
    float lowEngagementFactor = 1.3f;
    float jitter = 0.05f;
    uint64_t jitterSeed = 0;

    size_t completeLengthThreshold = 10;
    int64_t msPerWord = 200;
    float emotionalComplexityFactor = 1.5f;
    int64_t maxProcessingMs = 2000;
    int64_t turnTimeoutMs = 10000;
    int64_t transitionBaseMs = 500;

    bool isValid() const;
};

/**
 * One user utterance as seen by the state machine
 */
struct FlowInput {
    std::string text;
    emotion::EmotionalState emotion;
    crisis::CrisisAssessment crisis;
    std::optional<interruption::IntentionSignals> signals;
    int64_t elapsedMs = 0;   // time since the session's last activity
};

struct FlowOutcome {
    FlowDecision decision;
    FlowUpdate update;
};

enum class DelayContext {
    GREETING,
    RESPONDING,
    DEFAULT
};

/**
 * Per-session turn-taking controller.
 *
 * The machine holds no session state of its own: every call reads the flow
 * fields of a session snapshot and returns the decision together with the
 * updated fields, which the caller writes back through the memory store.
 *
 * Once a critical crisis forces an interrupt the session is held in PAUSED.
 * Only decide() with a new utterance releases the hold.
 */
class ConversationFlowStateMachine {
public:
    explicit ConversationFlowStateMachine(const FlowConfig& config = FlowConfig());
    virtual ~ConversationFlowStateMachine() = default;

    /**
     * Evaluate a new user utterance
     */
    virtual FlowOutcome decide(const FlowInput& input, const session::SessionContext& context) const;

    /**
     * Let time pass without user input: runs processing and transition countdowns
     */
    FlowOutcome advance(const session::SessionContext& context, int64_t elapsedMs) const;

    /**
     * Playback of the system response finished
     */
    FlowOutcome completeResponse(const session::SessionContext& context) const;

    /**
     * The barge-in arbiter produced a decision during playback
     */
    FlowOutcome onBargeIn(const session::SessionContext& context,
                          const interruption::InterruptionDecision& decision,
                          const interruption::IntentionSignals& signals,
                          const crisis::CrisisAssessment& crisis) const;

    /**
     * Transcription came back empty
     */
    FlowOutcome noInput(const session::SessionContext& context) const;

    float updateEngagement(float current, const std::string& text,
                           emotion::EmotionCategory emotion) const;
    int64_t responseDelayMs(DelayContext delayContext, float engagement,
                            const std::string& sessionId, uint64_t turnNumber) const;
    int64_t processingDelayMs(const std::string& text, emotion::EmotionCategory emotion) const;
    int64_t transitionDelayMs(float engagement) const;

    bool isGreeting(const std::string& text) const;
    bool looksComplete(const std::string& text) const;
    bool hasUrgentKeyword(const std::string& normalizedText) const;
    bool hasEmotionalContent(const std::string& normalizedText, emotion::EmotionCategory emotion) const;

    const FlowConfig& getConfig() const { return config_; }

    static const std::vector<std::string>& engagementKeywords();
    static const std::vector<std::string>& disengagementKeywords();
    static const std::vector<std::string>& urgentKeywords();

private:
    FlowOutcome decideForPhase(FlowPhase phase, const FlowInput& input,
                               const session::SessionContext& context, FlowUpdate update) const;
    FlowOutcome listen(const FlowInput& input, const session::SessionContext& context,
                       FlowUpdate update) const;
    float jitterFactor(const std::string& sessionId, uint64_t turnNumber) const;

    FlowConfig config_;
};

} // namespace flow
} // namespace affectrt

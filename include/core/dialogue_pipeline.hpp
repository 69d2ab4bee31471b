#pragma once

#include "audio/signal_sampler.hpp"
#include "core/collaborators.hpp"
#include "core/engine_config.hpp"
#include "core/prompt_context.hpp"
#include "core/task_queue.hpp"
#include "crisis/crisis_risk_assessor.hpp"
#include "emotion/emotion_fusion_engine.hpp"
#include "flow/conversation_flow_state_machine.hpp"
#include "interruption/interruption_types.hpp"
#include "session/session_memory_store.hpp"
#include "utils/error_handler.hpp"
#include "voice/voice_behavior_mapper.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace affectrt {
namespace core {

/**
 * One user utterance entering the pipeline
 */
struct TurnInput {
    std::string sessionId;
    std::string text;
    std::optional<std::vector<float>> audio;
};

/**
 * Everything the host needs to act on a turn
 */
struct TurnResult {
    std::string sessionId;
    bool shouldSpeakNow = false;
    int64_t delayMs = 0;
    voice::VoiceParams voiceParams;
    bool escalate = false;
    bool noInput = false;

    flow::FlowDecision decision;
    emotion::EmotionalState emotionalState;
    crisis::CrisisAssessment crisis;
    PromptContext promptContext;

    // Stages that faulted and were replaced by their fallback
    std::vector<std::string> degradedStages;
};

/**
 * Replaceable pipeline stages. Empty members get the default implementation
 * built from the engine configuration.
 */
struct DialogueComponents {
    std::shared_ptr<const emotion::ScoringStrategy> scoringStrategy;
    std::shared_ptr<const crisis::CrisisRiskAssessor> assessor;
    std::shared_ptr<const flow::ConversationFlowStateMachine> flow;
    std::shared_ptr<const voice::VoiceBehaviorMapper> mapper;
};

/**
 * Dialogue Engine
 *
 * Runs one utterance through sampling, fusion, crisis assessment, flow and
 * voice mapping, then records the turn in the session store. Every stage
 * after validation is wrapped: a fault is reported to the ErrorHandler and
 * replaced by the stage fallback so the turn still produces a result. A
 * crisis-stage fault falls back to medium/medium, never to none.
 *
 * processTurn() runs on the calling thread. submitTurn() serializes turns
 * of the same session on the worker pool; different sessions run in parallel.
 */
class DialogueEngine {
public:
    DialogueEngine(const EngineConfig& config,
                   std::shared_ptr<session::SessionMemoryStore> store,
                   DialogueComponents components = DialogueComponents());
    ~DialogueEngine();

    DialogueEngine(const DialogueEngine&) = delete;
    DialogueEngine& operator=(const DialogueEngine&) = delete;

    /**
     * Start the worker pool used by submitTurn()
     */
    void initialize();
    void shutdown();
    bool isRunning() const;

    /**
     * Throws ValidationException for an empty session id or empty/oversized text
     */
    TurnResult processTurn(const TurnInput& input);

    std::future<TurnResult> submitTurn(TurnInput input);

    /**
     * Transcribe first. An empty or failed transcription yields a listen /
     * NO_INPUT result and records nothing.
     */
    TurnResult processAudioTurn(const std::string& sessionId, const std::vector<float>& audio,
                                uint32_t sampleRate, SpeechToText& speechToText);

    // Flow events from the host. Call from the thread that owns the session's turns.
    flow::FlowDecision advance(const std::string& sessionId, int64_t elapsedMs);
    flow::FlowDecision completeResponse(const std::string& sessionId);
    flow::FlowDecision applyBargeIn(const std::string& sessionId,
                                    const interruption::InterruptionDecision& decision,
                                    const interruption::IntentionSignals& signals,
                                    const crisis::CrisisAssessment& crisis);

    bool endSession(const std::string& sessionId);

    session::SessionMemoryStore& store() { return *store_; }
    const EngineConfig& getConfig() const { return config_; }

private:
    void validate(const TurnInput& input) const;
    std::optional<audio::AudioFeatures> sampleAudio(const TurnInput& input, TurnResult& result) const;

    template <typename T, typename Fn>
    T runStage(const char* stage, utils::ErrorSeverity severity, const std::string& sessionId,
               TurnResult& result, T fallback, Fn&& fn) const;

    EngineConfig config_;
    std::shared_ptr<session::SessionMemoryStore> store_;
    audio::SignalSampler sampler_;
    emotion::EmotionFusionEngine fusion_;
    std::shared_ptr<const crisis::CrisisRiskAssessor> assessor_;
    std::shared_ptr<const flow::ConversationFlowStateMachine> flow_;
    std::shared_ptr<const voice::VoiceBehaviorMapper> mapper_;

    std::shared_ptr<TaskQueue> taskQueue_;
    std::unique_ptr<SessionStrand> strand_;
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace core
} // namespace affectrt

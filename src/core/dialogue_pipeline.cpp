#include "core/dialogue_pipeline.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <chrono>
#include <sstream>

namespace affectrt {
namespace core {

namespace {

std::string describe(const TurnResult& result) {
    std::ostringstream oss;
    oss << "Turn for " << result.sessionId << ": "
        << emotion::emotion_utils::toString(result.emotionalState.primaryEmotion)
        << ", crisis " << crisis::crisis_utils::toString(result.crisis.level)
        << ", " << flow::flow_utils::toString(result.decision.action)
        << " (" << flow::flow_utils::toString(result.decision.reason) << ", "
        << result.decision.durationMs << "ms)";
    return oss.str();
}

} // namespace

DialogueEngine::DialogueEngine(const EngineConfig& config,
                               std::shared_ptr<session::SessionMemoryStore> store,
                               DialogueComponents components)
    : config_(config),
      store_(std::move(store)),
      sampler_(config.audio),
      fusion_(config.fusion, components.scoringStrategy),
      assessor_(components.assessor ? components.assessor
                                    : std::make_shared<const crisis::CrisisRiskAssessor>(config.crisis)),
      flow_(components.flow ? components.flow
                            : std::make_shared<const flow::ConversationFlowStateMachine>(config.flow)),
      mapper_(components.mapper ? components.mapper
                                : std::make_shared<const voice::VoiceBehaviorMapper>(config.voice)) {
    if (!store_) {
        throw utils::ConfigurationException("Dialogue engine requires a session memory store");
    }
    auto validation = config_.validate();
    if (!validation.isValid) {
        std::string details;
        for (const auto& error : validation.errors) {
            details += error + "; ";
        }
        throw utils::ConfigurationException("Invalid engine configuration", details);
    }
    for (const auto& warning : validation.warnings) {
        utils::Logger::warn("Configuration warning: " + warning);
    }
}

DialogueEngine::~DialogueEngine() {
    shutdown();
}

void DialogueEngine::initialize() {
    if (pool_ && pool_->isRunning()) {
        return;
    }
    taskQueue_ = std::make_shared<TaskQueue>();
    strand_ = std::make_unique<SessionStrand>(taskQueue_);
    pool_ = std::make_unique<ThreadPool>(config_.pipeline.workerThreads);
    pool_->start(taskQueue_);
    utils::Logger::info("Dialogue engine started with " + std::to_string(config_.pipeline.workerThreads) +
                        " worker threads");
}

void DialogueEngine::shutdown() {
    if (!pool_) {
        return;
    }
    // Workers finish queued turns before the strand goes away
    pool_->stop();
    pool_.reset();
    strand_.reset();
    taskQueue_.reset();
    utils::Logger::info("Dialogue engine stopped");
}

bool DialogueEngine::isRunning() const {
    return pool_ && pool_->isRunning();
}

void DialogueEngine::validate(const TurnInput& input) const {
    if (input.sessionId.empty()) {
        throw utils::ValidationException("Session id must not be empty");
    }
    if (utils::text::trim(input.text).empty()) {
        throw utils::ValidationException("Utterance text must not be empty", input.sessionId);
    }
    if (input.text.size() > config_.pipeline.maxInputChars) {
        throw utils::ValidationException("Utterance exceeds " + std::to_string(config_.pipeline.maxInputChars) +
                                         " characters", input.sessionId);
    }
}

template <typename T, typename Fn>
T DialogueEngine::runStage(const char* stage, utils::ErrorSeverity severity, const std::string& sessionId,
                           TurnResult& result, T fallback, Fn&& fn) const {
    utils::ErrorContext context(stage, sessionId);
    try {
        return fn();
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(
            utils::ErrorInfo(utils::ErrorCategory::PIPELINE, severity,
                             std::string("Stage '") + stage + "' failed", e.what(), stage, sessionId));
        utils::Logger::warn(std::string("Using fallback for stage '") + stage + "' in session " + sessionId);
        result.degradedStages.emplace_back(stage);
        return fallback;
    }
}

std::optional<audio::AudioFeatures> DialogueEngine::sampleAudio(const TurnInput& input, TurnResult& result) const {
    if (!input.audio || input.audio->empty()) {
        return std::nullopt;
    }
    auto features = runStage<std::optional<audio::AudioFeatures>>(
        "audio", utils::ErrorSeverity::WARNING, input.sessionId, result, std::nullopt,
        [&]() -> std::optional<audio::AudioFeatures> { return sampler_.analyze(*input.audio); });
    if (features && !features->present) {
        return std::nullopt;
    }
    return features;
}

TurnResult DialogueEngine::processTurn(const TurnInput& input) {
    validate(input);

    TurnResult result;
    result.sessionId = input.sessionId;

    const session::SessionContext snapshot = store_->getOrCreate(input.sessionId);
    const auto audio = sampleAudio(input, result);

    result.emotionalState = runStage<emotion::EmotionalState>(
        "fusion", utils::ErrorSeverity::ERROR, input.sessionId, result, emotion::EmotionalState::neutral(),
        [&]() { return fusion_.fuse(input.text, snapshot, audio); });

    result.crisis = runStage<crisis::CrisisAssessment>(
        "crisis", utils::ErrorSeverity::CRITICAL, input.sessionId, result,
        crisis::CrisisAssessment::cautiousFallback(),
        [&]() { return assessor_->assess(input.text, audio, snapshot); });

    flow::FlowInput flowInput;
    flowInput.text = input.text;
    flowInput.emotion = result.emotionalState;
    flowInput.crisis = result.crisis;
    flowInput.elapsedMs = std::chrono::duration_cast<Milliseconds>(
        store_->clock().now() - snapshot.lastActivity).count();

    flow::FlowOutcome fallbackOutcome;
    fallbackOutcome.decision = flow::FlowDecision::fallback();
    fallbackOutcome.update.phase = flow::FlowPhase::LISTENING;
    fallbackOutcome.update.engagement = snapshot.engagement;
    fallbackOutcome.update.interruptionCount = snapshot.interruptionCount;
    fallbackOutcome.update.crisisHold = snapshot.crisisHold;
    if (snapshot.crisisHold) {
        fallbackOutcome.update.phase = flow::FlowPhase::PAUSED;
    }

    const flow::FlowOutcome outcome = runStage<flow::FlowOutcome>(
        "flow", utils::ErrorSeverity::ERROR, input.sessionId, result, fallbackOutcome,
        [&]() { return flow_->decide(flowInput, snapshot); });
    result.decision = outcome.decision;

    voice::VoiceContext voiceContext;
    voiceContext.turnNumber = snapshot.turnNumber + 1;
    voiceContext.drift = snapshot.drift;
    voiceContext.roleBaseline = snapshot.roleBaseline;
    result.voiceParams = runStage<voice::VoiceParams>(
        "voice", utils::ErrorSeverity::ERROR, input.sessionId, result, voice::VoiceParams::defaultPreset(),
        [&]() { return mapper_->map(result.emotionalState, result.crisis, voiceContext); });

    result.promptContext = PromptContext::build(snapshot, result.emotionalState, result.crisis, result.decision);
    result.shouldSpeakNow = result.decision.action == flow::FlowAction::SPEAK;
    result.delayMs = result.decision.durationMs;
    result.escalate = result.crisis.requiresEscalation();

    {
        utils::ErrorContext context("record", input.sessionId);
        try {
            store_->record(input.sessionId, result.emotionalState,
                           utils::text::excerpt(input.text, config_.session.excerptMaxChars),
                           result.crisis.level);
            store_->applyFlow(input.sessionId, outcome.update);
        } catch (const std::exception& e) {
            AFFECTRT_HANDLE_EXCEPTION(e, "record");
            result.degradedStages.emplace_back("record");
        }
    }

    if (result.escalate) {
        utils::Logger::warn(describe(result) + ", escalation required");
    } else {
        utils::Logger::debug(describe(result));
    }
    return result;
}

std::future<TurnResult> DialogueEngine::submitTurn(TurnInput input) {
    if (!isRunning()) {
        throw utils::PipelineException("Dialogue engine is not running", "submit");
    }
    const std::string key = input.sessionId;
    return strand_->submit(key, [this, input = std::move(input)]() { return processTurn(input); });
}

TurnResult DialogueEngine::processAudioTurn(const std::string& sessionId, const std::vector<float>& audio,
                                            uint32_t sampleRate, SpeechToText& speechToText) {
    if (sessionId.empty()) {
        throw utils::ValidationException("Session id must not be empty");
    }

    TranscriptionResult transcription;
    {
        utils::ErrorContext context("transcription", sessionId);
        try {
            transcription = speechToText.transcribe(audio, sampleRate);
            if (!transcription.success && !transcription.error_message.empty()) {
                AFFECTRT_HANDLE_ERROR(utils::ErrorCategory::PIPELINE, utils::ErrorSeverity::WARNING,
                                      "Transcription failed", transcription.error_message);
            }
        } catch (const std::exception& e) {
            AFFECTRT_HANDLE_EXCEPTION(e, "transcription");
            transcription = TranscriptionResult();
        }
    }

    const std::string text = utils::text::trim(transcription.text);
    if (text.empty()) {
        const session::SessionContext snapshot = store_->getOrCreate(sessionId);
        const flow::FlowOutcome outcome = flow_->noInput(snapshot);
        store_->applyFlow(sessionId, outcome.update);

        TurnResult result;
        result.sessionId = sessionId;
        result.noInput = true;
        result.decision = outcome.decision;
        result.delayMs = outcome.decision.durationMs;
        result.voiceParams = voice::VoiceParams::defaultPreset();
        result.promptContext = PromptContext::build(snapshot, result.emotionalState, result.crisis, result.decision);
        utils::Logger::debug("No input for session " + sessionId);
        return result;
    }

    TurnInput input;
    input.sessionId = sessionId;
    input.text = text;
    input.audio = audio;
    return processTurn(input);
}

flow::FlowDecision DialogueEngine::advance(const std::string& sessionId, int64_t elapsedMs) {
    auto snapshot = store_->find(sessionId);
    if (!snapshot) {
        return flow::FlowDecision();
    }
    const flow::FlowOutcome outcome = flow_->advance(*snapshot, elapsedMs);
    store_->applyFlow(sessionId, outcome.update);
    return outcome.decision;
}

flow::FlowDecision DialogueEngine::completeResponse(const std::string& sessionId) {
    auto snapshot = store_->find(sessionId);
    if (!snapshot) {
        return flow::FlowDecision();
    }
    const flow::FlowOutcome outcome = flow_->completeResponse(*snapshot);
    store_->applyFlow(sessionId, outcome.update);
    return outcome.decision;
}

flow::FlowDecision DialogueEngine::applyBargeIn(const std::string& sessionId,
                                                const interruption::InterruptionDecision& decision,
                                                const interruption::IntentionSignals& signals,
                                                const crisis::CrisisAssessment& crisis) {
    auto snapshot = store_->find(sessionId);
    if (!snapshot) {
        return flow::FlowDecision();
    }
    const flow::FlowOutcome outcome = flow_->onBargeIn(*snapshot, decision, signals, crisis);
    store_->applyFlow(sessionId, outcome.update);
    return outcome.decision;
}

bool DialogueEngine::endSession(const std::string& sessionId) {
    return store_->endSession(sessionId);
}

} // namespace core
} // namespace affectrt

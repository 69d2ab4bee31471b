#include "emotion/emotion_fusion_engine.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <sstream>

namespace affectrt {
namespace emotion {

namespace {

bool rankedBefore(const EmotionCandidate& a, const EmotionCandidate& b) {
    const int pa = emotion_utils::sourcePriority(a.source);
    const int pb = emotion_utils::sourcePriority(b.source);
    if (pa != pb) {
        return pa > pb;
    }
    return a.confidence > b.confidence;
}

// Confidence for a prosodic cue that cleared its threshold: 0.5 at the
// threshold rising to 0.8 at full scale
float prosodicConfidence(float signal, float threshold) {
    const float span = std::max(1e-3f, 1.0f - threshold);
    return std::clamp(0.5f + 0.3f * (signal - threshold) / span, 0.0f, 1.0f);
}

} // namespace

bool FusionConfig::isValid() const {
    return confidenceThreshold >= 0.0f && confidenceThreshold <= 1.0f &&
           overrideConfidence > 0.0f && overrideConfidence <= 1.0f &&
           blendPrimaryWeight >= 0.5f && blendPrimaryWeight <= 1.0f &&
           continuityRunLength > 0;
}

EmotionFusionEngine::EmotionFusionEngine(const FusionConfig& config,
                                         std::shared_ptr<const ScoringStrategy> strategy)
    : config_(config),
      strategy_(strategy ? std::move(strategy) : std::make_shared<KeywordScoringStrategy>()) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid fusion configuration");
    }
}

const std::vector<OverrideDirective>& EmotionFusionEngine::overrideDirectives() {
    static const std::vector<OverrideDirective> directives = {
        {"laugh with me", EmotionCategory::JOY, 0.8f},
        {"whisper", EmotionCategory::INTIMATE, 0.6f},
        {"be angry", EmotionCategory::ANGER, 0.7f},
        {"sound angry", EmotionCategory::ANGER, 0.7f},
        {"be sad", EmotionCategory::SADNESS, 0.7f},
        {"sound sad", EmotionCategory::SADNESS, 0.7f},
        {"sound scared", EmotionCategory::FEAR, 0.8f},
        {"be excited", EmotionCategory::JOY, 0.9f},
        {"sound excited", EmotionCategory::JOY, 0.9f},
        {"be calm", EmotionCategory::RELIEF, 0.6f},
        {"sound calm", EmotionCategory::RELIEF, 0.6f},
        {"sound surprised", EmotionCategory::SURPRISE, 0.8f},
    };
    return directives;
}

const std::vector<std::string>& EmotionFusionEngine::sarcasmMarkers() {
    static const std::vector<std::string> markers = {
        "yeah right", "sure", "obviously", "whatever", "like i care", "oh great", "wow", "amazing"};
    return markers;
}

std::vector<EmotionCandidate> EmotionFusionEngine::detectLexical(const std::string& text) const {
    auto candidates = strategy_->score(text);
    for (auto& candidate : candidates) {
        candidate.source = SourceKind::LEXICAL;
    }
    return candidates;
}

std::vector<EmotionCandidate> EmotionFusionEngine::detectContextual(
    const session::SessionContext& context) const {
    std::vector<EmotionCandidate> candidates;

    // The utterance being fused is the turn after the last recorded one
    if (context.turnNumber + 1 == 1) {
        candidates.push_back(EmotionCandidate{EmotionCategory::NEUTRAL,
                                              config_.firstTurnNeutralConfidence,
                                              config_.firstTurnNeutralIntensity,
                                              SourceKind::CONTEXTUAL});
    }

    auto recent = context.recentEmotions.getLatest(config_.continuityRunLength);
    if (recent.size() == config_.continuityRunLength &&
        recent.front().emotion != EmotionCategory::NEUTRAL &&
        std::all_of(recent.begin(), recent.end(), [&](const session::EmotionRecord& r) {
            return r.emotion == recent.front().emotion;
        })) {
        float intensity = 0.0f;
        for (const auto& record : recent) {
            intensity += record.intensity;
        }
        intensity /= static_cast<float>(recent.size());
        candidates.push_back(EmotionCandidate{recent.front().emotion, config_.continuityConfidence,
                                              intensity, SourceKind::CONTEXTUAL});
    }
    return candidates;
}

std::vector<EmotionCandidate> EmotionFusionEngine::detectOverride(const std::string& normalizedText) const {
    std::vector<EmotionCandidate> candidates;
    for (const auto& directive : overrideDirectives()) {
        if (utils::text::containsPhrase(normalizedText, directive.phrase)) {
            candidates.push_back(EmotionCandidate{directive.emotion, config_.overrideConfidence,
                                                  directive.intensity, SourceKind::OVERRIDE});
        }
    }
    return candidates;
}

std::vector<EmotionCandidate> EmotionFusionEngine::detectProsodic(const audio::AudioFeatures& audio) const {
    std::vector<EmotionCandidate> candidates;
    if (!audio.present) {
        return candidates;
    }

    if (audio.excitement > 0.8f && audio.stressHint > 0.5f) {
        candidates.push_back(EmotionCandidate{EmotionCategory::ANGER,
                                              prosodicConfidence(audio.excitement, 0.8f),
                                              audio.excitement, SourceKind::PROSODIC});
    }
    if (audio.excitement > 0.6f) {
        candidates.push_back(EmotionCandidate{EmotionCategory::JOY,
                                              prosodicConfidence(audio.excitement, 0.6f),
                                              audio.excitement, SourceKind::PROSODIC});
    }
    if (audio.stressHint > 0.6f) {
        candidates.push_back(EmotionCandidate{EmotionCategory::ANXIETY,
                                              prosodicConfidence(audio.stressHint, 0.6f),
                                              audio.stressHint, SourceKind::PROSODIC});
    }
    if (audio.calmness > 0.7f) {
        candidates.push_back(EmotionCandidate{EmotionCategory::RELIEF,
                                              prosodicConfidence(audio.calmness, 0.7f),
                                              1.0f - audio.calmness, SourceKind::PROSODIC});
    }
    return candidates;
}

bool EmotionFusionEngine::hasSarcasmMarker(const std::string& normalizedText) const {
    return utils::text::countPhrases(normalizedText, sarcasmMarkers()) > 0;
}

EmotionalState EmotionFusionEngine::fuse(const std::string& text,
                                         const session::SessionContext& context,
                                         const std::optional<audio::AudioFeatures>& audio) const {
    const std::string normalized = utils::text::normalize(text);

    std::vector<EmotionCandidate> merged;
    auto append = [&merged](std::vector<EmotionCandidate> more) {
        merged.insert(merged.end(), more.begin(), more.end());
    };
    append(detectOverride(normalized));
    append(detectLexical(text));
    append(detectContextual(context));
    if (audio) {
        append(detectProsodic(*audio));
    }

    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [this](const EmotionCandidate& c) {
                                    return c.confidence < config_.confidenceThreshold;
                                }),
                 merged.end());
    std::stable_sort(merged.begin(), merged.end(), rankedBefore);

    const bool sarcasm = hasSarcasmMarker(normalized);

    if (merged.empty()) {
        EmotionalState neutral = EmotionalState::neutral();
        neutral.sarcasmSuspected = sarcasm;
        return neutral;
    }

    EmotionalState state;
    state.detectedCandidates = merged;
    const EmotionCandidate& primary = merged.front();
    state.primaryEmotion = primary.emotion;
    state.confidence = primary.confidence;
    state.intensity = primary.intensity;
    state.sarcasmSuspected = sarcasm;

    PADTriple pad = emotion_utils::profileFor(primary.emotion);

    auto secondary = std::find_if(merged.begin() + 1, merged.end(), [&](const EmotionCandidate& c) {
        return c.emotion != primary.emotion && c.emotion != EmotionCategory::NEUTRAL;
    });
    if (secondary != merged.end()) {
        state.secondaryEmotion = secondary->emotion;
        state.isBlended = true;

        const float w = config_.blendPrimaryWeight;
        const PADTriple other = emotion_utils::profileFor(secondary->emotion);
        pad.pleasure = w * pad.pleasure + (1.0f - w) * other.pleasure;
        pad.arousal = w * pad.arousal + (1.0f - w) * other.arousal;
        pad.dominance = w * pad.dominance + (1.0f - w) * other.dominance;
    }

    // Blending first, then sarcasm: a positive reading contradicted by a
    // negative candidate is flipped and damped
    if (sarcasm && pad.pleasure > 0.0f &&
        std::any_of(merged.begin(), merged.end(), [](const EmotionCandidate& c) {
            return emotion_utils::isNegative(c.emotion);
        })) {
        pad.pleasure *= config_.sarcasmPleasureFactor;
    }

    pad = emotion_utils::clampPad(pad);
    state.pleasure = pad.pleasure;
    state.arousal = pad.arousal;
    state.dominance = pad.dominance;

    if (utils::Logger::getLevel() == utils::LogLevel::DEBUG) {
        std::ostringstream oss;
        oss << "Fused emotion for " << context.sessionId << ": "
            << emotion_utils::toString(state.primaryEmotion)
            << " (confidence " << state.confidence << ", " << merged.size() << " candidates";
        if (state.isBlended) {
            oss << ", blended with " << emotion_utils::toString(state.secondaryEmotion);
        }
        if (state.sarcasmSuspected) {
            oss << ", sarcasm suspected";
        }
        oss << ")";
        utils::Logger::debug(oss.str());
    }
    return state;
}

} // namespace emotion
} // namespace affectrt

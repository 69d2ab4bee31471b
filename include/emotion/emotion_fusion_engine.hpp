#pragma once

#include "audio/signal_sampler.hpp"
#include "emotion/emotion_types.hpp"
#include "emotion/scoring_strategy.hpp"
#include "session/session_context.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace affectrt {
namespace emotion {

/**
 * Fusion thresholds and detector constants
 */
struct FusionConfig {
    float confidenceThreshold = 0.4f;
    float overrideConfidence = 0.9f;
    float firstTurnNeutralConfidence = 0.6f;
    float firstTurnNeutralIntensity = 0.5f;
    size_t continuityRunLength = 3;
    float continuityConfidence = 0.45f;
    float blendPrimaryWeight = 0.7f;
    float sarcasmPleasureFactor = -0.5f;

    bool isValid() const;
};

/**
 * Explicit directive that short-circuits detection
 */
struct OverrideDirective {
    std::string phrase;
    EmotionCategory emotion;
    float intensity;
};

/**
 * Combines lexical, contextual, override and prosodic candidates into one
 * ranked EmotionalState per utterance.
 *
 * fuse() only reads the session snapshot and is deterministic for a given
 * (text, context, audio) triple.
 */
class EmotionFusionEngine {
public:
    explicit EmotionFusionEngine(const FusionConfig& config = FusionConfig(),
                                 std::shared_ptr<const ScoringStrategy> strategy = nullptr);

    EmotionalState fuse(const std::string& text,
                        const session::SessionContext& context,
                        const std::optional<audio::AudioFeatures>& audio = std::nullopt) const;

    // Individual detectors, exposed for testing
    std::vector<EmotionCandidate> detectLexical(const std::string& text) const;
    std::vector<EmotionCandidate> detectContextual(const session::SessionContext& context) const;
    std::vector<EmotionCandidate> detectOverride(const std::string& normalizedText) const;
    std::vector<EmotionCandidate> detectProsodic(const audio::AudioFeatures& audio) const;

    /**
     * True when the text contains a sarcasm marker phrase
     */
    bool hasSarcasmMarker(const std::string& normalizedText) const;

    const FusionConfig& getConfig() const { return config_; }
    const ScoringStrategy& getStrategy() const { return *strategy_; }

    static const std::vector<OverrideDirective>& overrideDirectives();
    static const std::vector<std::string>& sarcasmMarkers();

private:
    FusionConfig config_;
    std::shared_ptr<const ScoringStrategy> strategy_;
};

} // namespace emotion
} // namespace affectrt

#pragma once

#include "crisis/crisis_types.hpp"
#include "emotion/emotion_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace affectrt {
namespace voice {

/**
 * Delivery parameters handed to the synthesis collaborator
 */
struct VoiceParams {
    float rateMultiplier = 1.0f;
    float pitchMultiplier = 1.0f;
    float volumeMultiplier = 1.0f;
    std::string styleTag = "warm";

    static VoiceParams defaultPreset();
};

struct VoiceConfig {
    float minMultiplier = 0.5f;
    float maxMultiplier = 2.0f;
    float intensityGain = 0.1f;
    uint64_t fatigueTurns = 20;
    float fatigueRateStep = 0.05f;
    float fatigueRateFloor = 0.8f;
    float fatigueVolumeStep = 0.03f;
    float fatigueVolumeFloor = 0.7f;
    float highCrisisRateCap = 0.95f;
    float driftThreshold = 0.3f;
    float driftAnchorWeight = 0.5f;
    float roleAnchorDistance = 1.5f;
    float roleAnchorPull = 0.3f;

    bool isValid() const;
};

/**
 * Session facts the mapper reads
 */
struct VoiceContext {
    uint64_t turnNumber = 0;
    float drift = 0.0f;
    std::optional<emotion::PADTriple> roleBaseline;
};

/**
 * Projects the fused emotional state and crisis level onto voice parameters.
 * A critical crisis always selects the comforting preset.
 */
class VoiceBehaviorMapper {
public:
    explicit VoiceBehaviorMapper(const VoiceConfig& config = VoiceConfig());
    virtual ~VoiceBehaviorMapper() = default;

    virtual VoiceParams map(const emotion::EmotionalState& state,
                    const crisis::CrisisAssessment& crisis,
                    const VoiceContext& context = VoiceContext()) const;

    VoiceParams presetFor(emotion::EmotionCategory emotion) const;

    const VoiceConfig& getConfig() const { return config_; }

    static VoiceParams crisisPreset();

private:
    VoiceParams clampParams(VoiceParams params) const;
    static VoiceParams towardPersona(VoiceParams params, float weight);

    VoiceConfig config_;
    std::map<emotion::EmotionCategory, VoiceParams> presets_;
};

} // namespace voice
} // namespace affectrt

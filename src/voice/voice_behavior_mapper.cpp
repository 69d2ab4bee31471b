#include "voice/voice_behavior_mapper.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace affectrt {
namespace voice {

using emotion::EmotionCategory;

namespace {

float finiteOr(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

} // namespace

VoiceParams VoiceParams::defaultPreset() {
    return VoiceParams{1.0f, 1.0f, 1.0f, "warm"};
}

bool VoiceConfig::isValid() const {
    return minMultiplier > 0.0f && minMultiplier < maxMultiplier &&
           fatigueRateFloor >= minMultiplier && fatigueVolumeFloor >= minMultiplier &&
           driftAnchorWeight >= 0.0f && driftAnchorWeight <= 1.0f &&
           roleAnchorDistance >= 0.0f && roleAnchorPull >= 0.0f && roleAnchorPull <= 1.0f;
}

VoiceBehaviorMapper::VoiceBehaviorMapper(const VoiceConfig& config) : config_(config) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid voice configuration");
    }
    presets_ = {
        {EmotionCategory::NEUTRAL, {1.0f, 1.0f, 1.0f, "warm"}},
        {EmotionCategory::JOY, {1.05f, 1.1f, 1.05f, "happy"}},
        {EmotionCategory::SADNESS, {0.9f, 0.9f, 0.9f, "caring"}},
        {EmotionCategory::ANGER, {0.95f, 0.95f, 0.95f, "calm"}},
        {EmotionCategory::ANXIETY, {0.9f, 0.95f, 0.9f, "calm"}},
        {EmotionCategory::SURPRISE, {1.1f, 1.2f, 1.1f, "excited"}},
        {EmotionCategory::FEAR, {0.9f, 0.9f, 0.85f, "protective"}},
        {EmotionCategory::DISGUST, {0.95f, 0.9f, 0.9f, "neutral"}},
        {EmotionCategory::CONTEMPT, {0.95f, 0.95f, 0.9f, "neutral"}},
        {EmotionCategory::RELIEF, {0.95f, 1.0f, 0.95f, "warm"}},
        {EmotionCategory::PRIDE, {1.0f, 1.1f, 1.05f, "happy"}},
        {EmotionCategory::BITTERSWEET, {0.95f, 1.0f, 0.95f, "warm"}},
        {EmotionCategory::NOSTALGIC, {0.9f, 1.0f, 0.9f, "warm"}},
        {EmotionCategory::CURIOUS, {1.0f, 1.05f, 1.0f, "curious"}},
        {EmotionCategory::INTIMATE, {0.9f, 0.95f, 0.8f, "whisper"}},
    };
}

VoiceParams VoiceBehaviorMapper::crisisPreset() {
    return VoiceParams{0.85f, 0.95f, 0.9f, "comforting"};
}

VoiceParams VoiceBehaviorMapper::presetFor(EmotionCategory emotion) const {
    auto it = presets_.find(emotion);
    return it != presets_.end() ? it->second : VoiceParams::defaultPreset();
}

VoiceParams VoiceBehaviorMapper::clampParams(VoiceParams params) const {
    auto clampOne = [this](float value) {
        return std::clamp(finiteOr(value, 1.0f), config_.minMultiplier, config_.maxMultiplier);
    };
    params.rateMultiplier = clampOne(params.rateMultiplier);
    params.pitchMultiplier = clampOne(params.pitchMultiplier);
    params.volumeMultiplier = clampOne(params.volumeMultiplier);
    return params;
}

VoiceParams VoiceBehaviorMapper::towardPersona(VoiceParams params, float weight) {
    const VoiceParams anchor = VoiceParams::defaultPreset();
    params.rateMultiplier += weight * (anchor.rateMultiplier - params.rateMultiplier);
    params.pitchMultiplier += weight * (anchor.pitchMultiplier - params.pitchMultiplier);
    params.volumeMultiplier += weight * (anchor.volumeMultiplier - params.volumeMultiplier);
    return params;
}

VoiceParams VoiceBehaviorMapper::map(const emotion::EmotionalState& state,
                                     const crisis::CrisisAssessment& crisis,
                                     const VoiceContext& context) const {
    if (crisis.level == crisis::CrisisLevel::CRITICAL) {
        return clampParams(crisisPreset());
    }

    VoiceParams params = presetFor(state.primaryEmotion);

    const float intensity = std::clamp(finiteOr(state.intensity, 0.5f), 0.0f, 1.0f);
    const float intensityFactor = 1.0f + config_.intensityGain * (intensity - 0.5f);
    params.pitchMultiplier *= intensityFactor;
    params.volumeMultiplier *= intensityFactor;

    // The assistant's voice drifts back toward its own anchor when the
    // session's affect has moved far from baseline
    if (finiteOr(context.drift, 0.0f) > config_.driftThreshold) {
        params = towardPersona(params, config_.driftAnchorWeight);
    }

    // Role consistency: affect far from the session's role anchor is voiced
    // partly in the persona's own register
    if (context.roleBaseline) {
        const float distance = emotion::emotion_utils::padDistance(
            emotion::emotion_utils::clampPad(state.pad()), *context.roleBaseline);
        if (distance > config_.roleAnchorDistance) {
            params = towardPersona(params, config_.roleAnchorPull);
            utils::Logger::debug("Voice anchored to role baseline, PAD distance " + std::to_string(distance));
        }
    }

    if (context.turnNumber > config_.fatigueTurns) {
        params.rateMultiplier = std::max(config_.fatigueRateFloor, params.rateMultiplier - config_.fatigueRateStep);
        params.volumeMultiplier =
            std::max(config_.fatigueVolumeFloor, params.volumeMultiplier - config_.fatigueVolumeStep);
    }

    if (crisis.level == crisis::CrisisLevel::HIGH) {
        params.rateMultiplier = std::min(params.rateMultiplier, config_.highCrisisRateCap);
        params.styleTag = "caring";
    }

    return clampParams(params);
}

} // namespace voice
} // namespace affectrt

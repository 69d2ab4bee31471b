#pragma once

#include "crisis/crisis_types.hpp"
#include "interruption/interruption_types.hpp"
#include <string>
#include <vector>

namespace affectrt {
namespace interruption {

struct InterruptionConfig {
    // Probability weights of the intention signals
    float breathWeight = 0.30f;
    float micromovementWeight = 0.20f;
    float backgroundPrepWeight = 0.15f;
    float pausePatternWeight = 0.25f;
    float urgencyWeight = 0.10f;

    float yieldThreshold = 0.5f;
    float thoughtCompleteBonus = 0.2f;
    float earlySentencePenalty = 0.3f;
    float earlySentenceProgress = 0.3f;
    float lowEngagementBonus = 0.3f;
    float lowEngagementThreshold = 0.4f;

    float overrideUrgency = 0.9f;
    float urgentDelayUrgency = 0.6f;
    float redirectUrgency = 0.7f;
    float thoughtCompleteThreshold = 0.7f;
    int64_t minIncompleteDelayMs = 500;
    int64_t incompleteDelayScaleMs = 2000;
    int64_t maxYieldDelayMs = 2000;
    int64_t urgentDelayCapMs = 200;

    // Barge-in monitor
    int64_t pollIntervalMs = 50;
    float micLevelThreshold = 0.02f;

    bool isValid() const;
};

/**
 * Decides whether, when and how synthesized playback yields to the user.
 * A critical crisis always yields immediately.
 */
class InterruptionArbiter {
public:
    explicit InterruptionArbiter(const InterruptionConfig& config = InterruptionConfig());

    InterruptionDecision evaluate(const IntentionSignals& signals,
                                  const PlaybackProgress& progress,
                                  const crisis::CrisisAssessment& crisis,
                                  float recentEngagement) const;

    /**
     * 0.5 base, +0.3 for a completion marker, +0.2 for terminal punctuation
     */
    float thoughtCompleteness(const std::string& sentence) const;

    float yieldProbability(const IntentionSignals& signals, const PlaybackProgress& progress,
                           float recentEngagement) const;

    const InterruptionConfig& getConfig() const { return config_; }

    static const std::vector<std::string>& completionMarkers();

private:
    InterruptionConfig config_;
};

} // namespace interruption
} // namespace affectrt

#include "interruption/interruption_arbiter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cmath>

namespace affectrt {
namespace interruption {

namespace {

float sanitize(float value) {
    return std::isfinite(value) ? std::clamp(value, 0.0f, 1.0f) : 0.0f;
}

} // namespace

std::string toString(ResumeStrategy strategy) {
    switch (strategy) {
        case ResumeStrategy::CONTINUE: return "continue";
        case ResumeStrategy::SUMMARIZE: return "summarize";
        case ResumeStrategy::REDIRECT: return "redirect";
        case ResumeStrategy::PAUSE_INDEFINITELY: return "pause_indefinitely";
        default: return "unknown";
    }
}

bool InterruptionConfig::isValid() const {
    const float weights = breathWeight + micromovementWeight + backgroundPrepWeight +
                          pausePatternWeight + urgencyWeight;
    return weights > 0.0f && yieldThreshold > 0.0f && yieldThreshold < 1.0f &&
           minIncompleteDelayMs >= 0 && maxYieldDelayMs >= minIncompleteDelayMs &&
           urgentDelayCapMs >= 0 && pollIntervalMs > 0 && micLevelThreshold >= 0.0f;
}

InterruptionArbiter::InterruptionArbiter(const InterruptionConfig& config) : config_(config) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid interruption configuration");
    }
}

const std::vector<std::string>& InterruptionArbiter::completionMarkers() {
    static const std::vector<std::string> markers = {
        "so", "therefore", "in conclusion", "finally", "ultimately",
        "that's why", "anyway", "basically", "essentially"};
    return markers;
}

float InterruptionArbiter::thoughtCompleteness(const std::string& sentence) const {
    float completeness = 0.5f;
    if (utils::text::countPhrases(utils::text::normalize(sentence), completionMarkers()) > 0) {
        completeness += 0.3f;
    }
    if (utils::text::endsWithTerminalPunctuation(sentence)) {
        completeness += 0.2f;
    }
    return std::min(1.0f, completeness);
}

float InterruptionArbiter::yieldProbability(const IntentionSignals& signals,
                                            const PlaybackProgress& progress,
                                            float recentEngagement) const {
    float p = config_.breathWeight * sanitize(signals.breathIntake) +
              config_.micromovementWeight * sanitize(signals.micromovement) +
              config_.backgroundPrepWeight * sanitize(signals.backgroundPrep) +
              config_.pausePatternWeight * sanitize(signals.pausePatternLikelihood) +
              config_.urgencyWeight * sanitize(signals.urgency);

    if (thoughtCompleteness(progress.currentSentence) >= config_.thoughtCompleteThreshold) {
        p += config_.thoughtCompleteBonus;
    }
    if (progress.sentenceProgress() < config_.earlySentenceProgress) {
        p -= config_.earlySentencePenalty;
    }
    if (sanitize(recentEngagement) < config_.lowEngagementThreshold) {
        p += config_.lowEngagementBonus;
    }
    return p;
}

InterruptionDecision InterruptionArbiter::evaluate(const IntentionSignals& signals,
                                                   const PlaybackProgress& progress,
                                                   const crisis::CrisisAssessment& crisis,
                                                   float recentEngagement) const {
    InterruptionDecision decision;

    if (crisis.level == crisis::CrisisLevel::CRITICAL || sanitize(signals.urgency) > config_.overrideUrgency) {
        decision.shouldYield = true;
        decision.confidence = 0.95f;
        decision.delayMs = 0;
        decision.resumeStrategy = ResumeStrategy::PAUSE_INDEFINITELY;
        return decision;
    }

    const float p = yieldProbability(signals, progress, recentEngagement);
    const float completeness = thoughtCompleteness(progress.currentSentence);
    const bool thoughtComplete = completeness >= config_.thoughtCompleteThreshold;
    const float urgency = sanitize(signals.urgency);

    decision.shouldYield = p > config_.yieldThreshold;
    decision.confidence = std::min(1.0f, std::fabs(p - config_.yieldThreshold) * 2.0f);

    if (decision.shouldYield && !thoughtComplete) {
        const float incompleteness = config_.thoughtCompleteThreshold - completeness;
        const auto scaled = static_cast<int64_t>(std::llround(incompleteness * config_.incompleteDelayScaleMs));
        decision.delayMs = std::min(config_.maxYieldDelayMs, std::max(config_.minIncompleteDelayMs, scaled));
        if (urgency > config_.urgentDelayUrgency) {
            decision.delayMs = std::min(decision.delayMs, config_.urgentDelayCapMs);
        }
    }

    if (crisis.level >= crisis::CrisisLevel::HIGH || urgency > config_.redirectUrgency) {
        decision.resumeStrategy = ResumeStrategy::REDIRECT;
    } else if (!thoughtComplete) {
        decision.resumeStrategy = ResumeStrategy::SUMMARIZE;
    } else {
        decision.resumeStrategy = ResumeStrategy::CONTINUE;
    }

    utils::Logger::debug("Barge-in probability " + std::to_string(p) +
                         (decision.shouldYield ? ", yielding" : ", holding floor"));
    return decision;
}

} // namespace interruption
} // namespace affectrt

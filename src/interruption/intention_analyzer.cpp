#include "interruption/intention_analyzer.hpp"
#include <algorithm>
#include <cmath>

namespace affectrt {
namespace interruption {

IntentionAnalyzer::IntentionAnalyzer(const audio::AudioConfig& audioConfig,
                                     const IntentionAnalyzerConfig& config)
    : sampler_(audioConfig), config_(config) {
    if (config_.windowFrames == 0) {
        config_.windowFrames = 1;
    }
}

float IntentionAnalyzer::shortBursts(const std::vector<float>& frame) const {
    const size_t size = config_.burstWindowSamples;
    if (size == 0 || frame.size() < size) {
        return 0.0f;
    }
    size_t bursts = 0;
    for (size_t start = 0; start + size <= frame.size(); start += size) {
        float energy = 0.0f;
        for (size_t i = start; i < start + size; ++i) {
            energy += frame[i] * frame[i];
        }
        const float rms = std::sqrt(energy / static_cast<float>(size));
        if (rms > config_.burstMinRms && rms < config_.burstMaxRms) {
            bursts++;
        }
    }
    return std::min(1.0f, static_cast<float>(bursts) / config_.burstNormalizer);
}

IntentionSignals IntentionAnalyzer::pushFrame(const std::vector<float>& frame, core::TimePoint now) {
    const audio::FrameFeatures features = sampler_.analyzeFrame(frame);

    FrameEvidence evidence;
    evidence.speech = features.voiced;

    if (previous_) {
        const float spike = std::min(1.0f, std::max(0.0f, features.peak - previous_->peak) * config_.spikeScale);
        const bool refractory = lastBreath_ &&
            std::chrono::duration_cast<core::Milliseconds>(now - *lastBreath_).count() < config_.breathRefractoryMs;
        if (!refractory && features.voiced) {
            evidence.breath = std::min(1.0f, 0.6f * features.lowBandRatio + 0.4f * spike);
            if (evidence.breath > 0.5f) {
                lastBreath_ = now;
            }
        }
        evidence.micromovement =
            std::min(1.0f, std::fabs(features.rms - previous_->rms) / config_.micromovementScale);
    }
    if (features.voiced) {
        evidence.backgroundPrep =
            std::min(1.0f, 0.4f * features.highBandRatio + 0.6f * shortBursts(frame));
    }

    previous_ = features;
    window_.push_back(evidence);
    while (window_.size() > config_.windowFrames) {
        window_.pop_front();
    }
    return current();
}

IntentionSignals IntentionAnalyzer::current() const {
    IntentionSignals signals;
    if (window_.empty()) {
        return signals;
    }

    float breath = 0.0f;
    float micromovement = 0.0f;
    float background = 0.0f;
    size_t speechFollowed = 0;
    size_t quietAfterSpeech = 0;
    for (size_t i = 0; i < window_.size(); ++i) {
        breath += window_[i].breath;
        micromovement += window_[i].micromovement;
        background += window_[i].backgroundPrep;
        if (i > 0 && window_[i - 1].speech) {
            speechFollowed++;
            if (!window_[i].speech) {
                quietAfterSpeech++;
            }
        }
    }
    const float n = static_cast<float>(window_.size());
    signals.breathIntake = breath / n;
    signals.micromovement = micromovement / n;
    signals.backgroundPrep = background / n;
    signals.pausePatternLikelihood = speechFollowed == 0
        ? 0.5f
        : static_cast<float>(quietAfterSpeech) / static_cast<float>(speechFollowed);

    const float combined = (signals.breathIntake + signals.micromovement + signals.backgroundPrep) / 3.0f;
    signals.urgency = std::pow(std::clamp(combined, 0.0f, 1.0f), 1.5f);
    return signals;
}

void IntentionAnalyzer::reset() {
    window_.clear();
    previous_.reset();
    lastBreath_.reset();
}

} // namespace interruption
} // namespace affectrt

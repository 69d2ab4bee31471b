#pragma once

#include "audio/signal_sampler.hpp"
#include "core/scheduler.hpp"
#include "interruption/interruption_types.hpp"
#include <deque>
#include <optional>
#include <vector>

namespace affectrt {
namespace interruption {

struct IntentionAnalyzerConfig {
    size_t windowFrames = 10;
    int64_t breathRefractoryMs = 1000;
    float micromovementScale = 0.003f;
    size_t burstWindowSamples = 64;
    float burstMinRms = 0.05f;
    float burstMaxRms = 0.2f;
    float burstNormalizer = 10.0f;
    float spikeScale = 5.0f;
};

/**
 * Derives IntentionSignals from a sliding window of microphone frames.
 *
 * Per-frame evidence is averaged over the window so that a single loud
 * frame (a cough, a door) cannot trigger a barge-in by itself.
 * Not thread-safe; the owning monitor serializes access.
 */
class IntentionAnalyzer {
public:
    explicit IntentionAnalyzer(const audio::AudioConfig& audioConfig = audio::AudioConfig(),
                               const IntentionAnalyzerConfig& config = IntentionAnalyzerConfig());

    /**
     * Add one frame captured at the given time and return the window's signals
     */
    IntentionSignals pushFrame(const std::vector<float>& frame, core::TimePoint now);

    IntentionSignals current() const;
    size_t windowSize() const { return window_.size(); }
    void reset();

private:
    struct FrameEvidence {
        float breath = 0.0f;
        float micromovement = 0.0f;
        float backgroundPrep = 0.0f;
        bool speech = false;
    };

    float shortBursts(const std::vector<float>& frame) const;

    audio::SignalSampler sampler_;
    IntentionAnalyzerConfig config_;
    std::deque<FrameEvidence> window_;
    std::optional<audio::FrameFeatures> previous_;
    std::optional<core::TimePoint> lastBreath_;
};

} // namespace interruption
} // namespace affectrt

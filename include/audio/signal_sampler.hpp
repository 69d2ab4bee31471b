#pragma once

#include "audio/fft.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace affectrt {
namespace audio {

/**
 * Frame layout and analysis limits for the sampler
 */
struct AudioConfig {
    uint32_t sampleRate = 16000;
    size_t frameSize = 1024;
    size_t hopSize = 512;
    float minPitchHz = 80.0f;
    float maxPitchHz = 400.0f;
    float lowBandCutoffHz = 300.0f;
    float highBandCutoffHz = 3000.0f;
    float silenceRms = 0.01f;          // frames below this are unvoiced
    float voicingThreshold = 0.3f;     // normalized autocorrelation peak
    float nominalZeroCrossingRate = 0.1f;

    bool isValid() const;
};

/**
 * Short-horizon features of one frame
 */
struct FrameFeatures {
    float rms = 0.0f;
    float peak = 0.0f;
    float meanAbs = 0.0f;
    float zeroCrossingRate = 0.0f;
    float pitchHz = 0.0f;         // 0 when unvoiced
    float lowBandRatio = 0.0f;    // share of spectral energy below lowBandCutoffHz
    float highBandRatio = 0.0f;   // share of spectral energy above highBandCutoffHz
    bool voiced = false;
};

/**
 * Utterance-level features. Every score is normalized to [0, 1].
 * present == false means no audio accompanied the utterance.
 */
struct AudioFeatures {
    bool present = false;
    size_t frameCount = 0;

    float energy = 0.0f;
    float zeroCrossingRate = 0.0f;
    float pitchMeanHz = 0.0f;
    float pitchVariance = 0.0f;
    float lowBandRatio = 0.0f;
    float highBandRatio = 0.0f;
    float voicedFraction = 0.0f;

    // Crisis voice indicators
    float stress = 0.0f;
    float breathIrregularity = 0.0f;
    float tremor = 0.0f;
    float pitchInstability = 0.0f;
    float volumeInconsistency = 0.0f;
    float speechRate = 0.0f;

    // Prosodic hints for emotion fusion
    float excitement = 0.0f;
    float stressHint = 0.0f;
    float calmness = 0.0f;
};

/**
 * Extracts energy, zero-crossing, pitch and spectral-split features from
 * mono float PCM in [-1, 1]. Stateless after construction and safe to share
 * between threads.
 */
class SignalSampler {
public:
    explicit SignalSampler(const AudioConfig& config = AudioConfig());

    /**
     * Features of a single frame. Throws AudioSignalException on NaN/Inf samples.
     */
    FrameFeatures analyzeFrame(const std::vector<float>& frame) const;

    /**
     * Features of a whole utterance. An empty buffer yields present == false.
     * Throws AudioSignalException on NaN/Inf samples.
     */
    AudioFeatures analyze(const std::vector<float>& samples) const;

    /**
     * Mean absolute amplitude, the level used by barge-in polling.
     */
    static float micLevel(const std::vector<float>& frame);

    const AudioConfig& getConfig() const { return config_; }

private:
    float estimatePitch(const std::vector<float>& frame, float rms) const;
    void computeVoiceIndicators(const std::vector<float>& samples, AudioFeatures& features) const;
    static void ensureFinite(const std::vector<float>& samples);

    AudioConfig config_;
    FFT fft_;
};

} // namespace audio
} // namespace affectrt

#include "audio/signal_sampler.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace affectrt {
namespace audio {

namespace {

size_t nextPowerOfTwo(size_t value) {
    size_t result = 2;
    while (result < value) {
        result <<= 1;
    }
    return result;
}

float mean(const std::vector<float>& values) {
    if (values.empty()) {
        return 0.0f;
    }
    return std::accumulate(values.begin(), values.end(), 0.0f) / static_cast<float>(values.size());
}

float variance(const std::vector<float>& values) {
    if (values.empty()) {
        return 0.0f;
    }
    const float m = mean(values);
    float sum = 0.0f;
    for (float v : values) {
        sum += (v - m) * (v - m);
    }
    return sum / static_cast<float>(values.size());
}

// Split into consecutive chunks; the last chunk may be shorter
std::vector<std::vector<float>> chunk(const std::vector<float>& samples, size_t size) {
    std::vector<std::vector<float>> chunks;
    for (size_t start = 0; start < samples.size(); start += size) {
        size_t end = std::min(samples.size(), start + size);
        chunks.emplace_back(samples.begin() + start, samples.begin() + end);
    }
    return chunks;
}

float meanAbs(const std::vector<float>& values) {
    if (values.empty()) {
        return 0.0f;
    }
    float sum = 0.0f;
    for (float v : values) {
        sum += std::fabs(v);
    }
    return sum / static_cast<float>(values.size());
}

float clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}

} // namespace

bool AudioConfig::isValid() const {
    return sampleRate > 0 && frameSize >= 64 && hopSize > 0 && hopSize <= frameSize &&
           minPitchHz > 0.0f && maxPitchHz > minPitchHz &&
           maxPitchHz < static_cast<float>(sampleRate) / 2.0f &&
           lowBandCutoffHz < highBandCutoffHz && silenceRms >= 0.0f &&
           nominalZeroCrossingRate > 0.0f;
}

SignalSampler::SignalSampler(const AudioConfig& config)
    : config_(config), fft_(nextPowerOfTwo(config.frameSize)) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid audio sampler configuration");
    }
}

void SignalSampler::ensureFinite(const std::vector<float>& samples) {
    auto bad = std::find_if(samples.begin(), samples.end(),
                            [](float s) { return !std::isfinite(s); });
    if (bad != samples.end()) {
        throw utils::AudioSignalException(
            "Non-finite audio sample",
            "index " + std::to_string(std::distance(samples.begin(), bad)));
    }
}

float SignalSampler::micLevel(const std::vector<float>& frame) {
    return meanAbs(frame);
}

FrameFeatures SignalSampler::analyzeFrame(const std::vector<float>& frame) const {
    ensureFinite(frame);

    FrameFeatures features;
    if (frame.empty()) {
        return features;
    }

    float energy = 0.0f;
    size_t crossings = 0;
    for (size_t i = 0; i < frame.size(); ++i) {
        energy += frame[i] * frame[i];
        features.peak = std::max(features.peak, std::fabs(frame[i]));
        if (i > 0 && ((frame[i] >= 0.0f) != (frame[i - 1] >= 0.0f))) {
            crossings++;
        }
    }
    features.rms = std::sqrt(energy / static_cast<float>(frame.size()));
    features.meanAbs = meanAbs(frame);
    features.zeroCrossingRate = frame.size() > 1
        ? static_cast<float>(crossings) / static_cast<float>(frame.size() - 1)
        : 0.0f;
    features.voiced = features.rms > config_.silenceRms;
    features.pitchHz = features.voiced ? estimatePitch(frame, features.rms) : 0.0f;

    auto magnitude = fft_.magnitudeSpectrum(frame);
    const float nyquist = static_cast<float>(config_.sampleRate) / 2.0f + 1.0f;
    const float total = fft_.bandEnergy(magnitude, 0.0f, nyquist, config_.sampleRate);
    if (total > 0.0f) {
        features.lowBandRatio =
            fft_.bandEnergy(magnitude, 0.0f, config_.lowBandCutoffHz, config_.sampleRate) / total;
        features.highBandRatio =
            fft_.bandEnergy(magnitude, config_.highBandCutoffHz, nyquist, config_.sampleRate) / total;
    }
    return features;
}

float SignalSampler::estimatePitch(const std::vector<float>& frame, float rms) const {
    const size_t minLag = static_cast<size_t>(config_.sampleRate / config_.maxPitchHz);
    const size_t maxLag = std::min(frame.size() - 1,
                                   static_cast<size_t>(config_.sampleRate / config_.minPitchHz));
    if (minLag >= maxLag || rms <= 0.0f) {
        return 0.0f;
    }

    const float zeroLag = rms * rms * static_cast<float>(frame.size());
    float bestCorrelation = 0.0f;
    size_t bestLag = 0;
    for (size_t lag = minLag; lag <= maxLag; ++lag) {
        float sum = 0.0f;
        for (size_t i = 0; i + lag < frame.size(); ++i) {
            sum += frame[i] * frame[i + lag];
        }
        const float normalized = sum / zeroLag;
        if (normalized > bestCorrelation) {
            bestCorrelation = normalized;
            bestLag = lag;
        }
    }

    if (bestLag == 0 || bestCorrelation < config_.voicingThreshold) {
        return 0.0f;
    }
    return static_cast<float>(config_.sampleRate) / static_cast<float>(bestLag);
}

AudioFeatures SignalSampler::analyze(const std::vector<float>& samples) const {
    ensureFinite(samples);

    AudioFeatures features;
    if (samples.empty()) {
        return features;
    }
    features.present = true;

    std::vector<float> pitches;
    float rmsSum = 0.0f;
    float zcrSum = 0.0f;
    float lowSum = 0.0f;
    float highSum = 0.0f;
    size_t voiced = 0;

    size_t start = 0;
    do {
        size_t end = std::min(samples.size(), start + config_.frameSize);
        std::vector<float> frame(samples.begin() + start, samples.begin() + end);
        FrameFeatures f = analyzeFrame(frame);

        rmsSum += f.rms;
        zcrSum += f.zeroCrossingRate;
        lowSum += f.lowBandRatio;
        highSum += f.highBandRatio;
        if (f.voiced) {
            voiced++;
        }
        if (f.pitchHz > 0.0f) {
            pitches.push_back(f.pitchHz);
        }
        features.frameCount++;
        start += config_.hopSize;
    } while (start + config_.frameSize <= samples.size());

    const float frames = static_cast<float>(features.frameCount);
    features.energy = rmsSum / frames;
    features.zeroCrossingRate = zcrSum / frames;
    features.lowBandRatio = lowSum / frames;
    features.highBandRatio = highSum / frames;
    features.voicedFraction = static_cast<float>(voiced) / frames;
    features.pitchMeanHz = mean(pitches);
    features.pitchVariance = variance(pitches);

    computeVoiceIndicators(samples, features);

    features.excitement = clamp01(features.energy * 2.0f);
    features.stressHint = clamp01(features.zeroCrossingRate * 3.0f);
    features.calmness = 1.0f - std::max(features.excitement, features.stressHint);
    return features;
}

void SignalSampler::computeVoiceIndicators(const std::vector<float>& samples,
                                           AudioFeatures& features) const {
    std::vector<float> chunkVariances;
    std::vector<float> chunkMeans;
    for (const auto& c : chunk(samples, 512)) {
        chunkVariances.push_back(variance(c));
        chunkMeans.push_back(std::fabs(mean(c)));
    }
    features.tremor = clamp01(mean(chunkVariances) * 20.0f);
    features.pitchInstability = clamp01(variance(chunkMeans) * 10.0f);

    std::vector<float> volumes;
    for (const auto& c : chunk(samples, 256)) {
        volumes.push_back(meanAbs(c));
    }
    features.volumeInconsistency = clamp01(variance(volumes) * 5.0f);

    // Breath envelope: every 4th sample of each 1024-sample chunk
    std::vector<float> breaths;
    for (const auto& c : chunk(samples, 1024)) {
        std::vector<float> decimated;
        for (size_t i = 0; i < c.size(); i += 4) {
            decimated.push_back(c[i]);
        }
        breaths.push_back(meanAbs(decimated));
    }
    features.breathIrregularity = clamp01(variance(breaths) * 5.0f);

    features.stress = (features.tremor + features.pitchInstability + features.volumeInconsistency) / 3.0f;

    const float nominal = config_.nominalZeroCrossingRate;
    features.speechRate = clamp01(std::fabs(features.zeroCrossingRate - nominal) / nominal);
}

} // namespace audio
} // namespace affectrt

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace affectrt {
namespace audio {

/**
 * Radix-2 Cooley-Tukey FFT over real input with a precomputed Hann window.
 * Input shorter than the FFT size is zero-padded, longer input is truncated.
 */
class FFT {
public:
    explicit FFT(size_t fftSize = 1024);

    size_t size() const { return fftSize_; }

    /**
     * Magnitude of bins 0..N/2 of the windowed input.
     */
    std::vector<float> magnitudeSpectrum(const std::vector<float>& samples) const;

    /**
     * Sum of squared magnitudes between lowHz (inclusive) and highHz (exclusive).
     */
    float bandEnergy(const std::vector<float>& magnitude, float lowHz, float highHz,
                     uint32_t sampleRate) const;

    float binFrequency(size_t bin, uint32_t sampleRate) const;

private:
    void transform(std::vector<float>& interleaved) const;

    size_t fftSize_;
    std::vector<float> window_;
};

} // namespace audio
} // namespace affectrt

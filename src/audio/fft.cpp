#include "audio/fft.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>

namespace affectrt {
namespace audio {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

FFT::FFT(size_t fftSize) : fftSize_(fftSize) {
    if (fftSize_ < 2 || (fftSize_ & (fftSize_ - 1)) != 0) {
        throw utils::AudioSignalException("FFT size must be a power of two",
                                          "FFT size " + std::to_string(fftSize));
    }
    window_.resize(fftSize_);
    for (size_t i = 0; i < fftSize_; ++i) {
        window_[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * kPi * i / (fftSize_ - 1))));
    }
}

std::vector<float> FFT::magnitudeSpectrum(const std::vector<float>& samples) const {
    // Real and imaginary parts interleaved
    std::vector<float> data(fftSize_ * 2, 0.0f);
    const size_t count = std::min(samples.size(), fftSize_);
    for (size_t i = 0; i < count; ++i) {
        data[2 * i] = samples[i] * window_[i];
    }

    transform(data);

    std::vector<float> magnitude(fftSize_ / 2 + 1);
    for (size_t i = 0; i < magnitude.size(); ++i) {
        magnitude[i] = std::hypot(data[2 * i], data[2 * i + 1]);
    }
    return magnitude;
}

float FFT::bandEnergy(const std::vector<float>& magnitude, float lowHz, float highHz,
                      uint32_t sampleRate) const {
    float energy = 0.0f;
    for (size_t bin = 0; bin < magnitude.size(); ++bin) {
        float freq = binFrequency(bin, sampleRate);
        if (freq >= lowHz && freq < highHz) {
            energy += magnitude[bin] * magnitude[bin];
        }
    }
    return energy;
}

float FFT::binFrequency(size_t bin, uint32_t sampleRate) const {
    return static_cast<float>(bin) * static_cast<float>(sampleRate) / static_cast<float>(fftSize_);
}

void FFT::transform(std::vector<float>& data) const {
    const size_t n = fftSize_;

    // Bit-reversal permutation
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(data[2 * i], data[2 * j]);
            std::swap(data[2 * i + 1], data[2 * j + 1]);
        }
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        const double angle = -2.0 * kPi / static_cast<double>(len);
        const float wlenReal = static_cast<float>(std::cos(angle));
        const float wlenImag = static_cast<float>(std::sin(angle));

        for (size_t start = 0; start < n; start += len) {
            float wReal = 1.0f;
            float wImag = 0.0f;
            for (size_t k = 0; k < len / 2; ++k) {
                const size_t u = start + k;
                const size_t v = u + len / 2;

                const float tReal = data[2 * v] * wReal - data[2 * v + 1] * wImag;
                const float tImag = data[2 * v] * wImag + data[2 * v + 1] * wReal;

                data[2 * v] = data[2 * u] - tReal;
                data[2 * v + 1] = data[2 * u + 1] - tImag;
                data[2 * u] += tReal;
                data[2 * u + 1] += tImag;

                const float nextReal = wReal * wlenReal - wImag * wlenImag;
                wImag = wReal * wlenImag + wImag * wlenReal;
                wReal = nextReal;
            }
        }
    }
}

} // namespace audio
} // namespace affectrt

#pragma once

#include "core/scheduler.hpp"
#include "crisis/crisis_types.hpp"
#include "interruption/intention_analyzer.hpp"
#include "interruption/interruption_arbiter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace affectrt {
namespace interruption {

/**
 * Everything the monitor needs for one playback turn
 */
struct PlaybackTurn {
    // Latest microphone frame, or nullopt when none is ready. Must not block.
    std::function<std::optional<std::vector<float>>()> levelSource;
    std::function<PlaybackProgress()> progressSource;
    crisis::CrisisAssessment crisis;
    float recentEngagement = 0.5f;
    std::function<void(const InterruptionDecision&, const IntentionSignals&)> onYield;
};

/**
 * Polls the microphone while synthesized speech plays and fires onYield when
 * the arbiter decides to give up the floor.
 *
 * Runs as a ticking task on a Scheduler. beginTurn() and stop() cancel the
 * polling loop together with any pending yield timer. Each turn yields at
 * most once.
 */
class BargeInMonitor {
public:
    BargeInMonitor(core::Scheduler& scheduler,
                   const InterruptionConfig& config = InterruptionConfig(),
                   const audio::AudioConfig& audioConfig = audio::AudioConfig());
    ~BargeInMonitor();

    BargeInMonitor(const BargeInMonitor&) = delete;
    BargeInMonitor& operator=(const BargeInMonitor&) = delete;

    void beginTurn(PlaybackTurn turn);
    void stop();

    bool isActive() const;
    bool hasPendingYield() const;

    /**
     * Number of ticks since the current turn began
     */
    size_t tickCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace interruption
} // namespace affectrt

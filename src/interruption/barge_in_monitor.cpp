#include "interruption/barge_in_monitor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <mutex>

namespace affectrt {
namespace interruption {

class BargeInMonitor::Impl : public std::enable_shared_from_this<BargeInMonitor::Impl> {
public:
    Impl(core::Scheduler& scheduler, const InterruptionConfig& config, const audio::AudioConfig& audioConfig)
        : scheduler_(scheduler), arbiter_(config), analyzer_(audioConfig), config_(config) {}

    void beginTurn(PlaybackTurn turn) {
        if (!turn.levelSource || !turn.onYield) {
            throw utils::InterruptionException("Playback turn needs a level source and a yield callback");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        cancelLocked();
        analyzer_.reset();
        turn_ = std::move(turn);
        ticks_ = 0;
        const uint64_t generation = ++generation_;

        std::weak_ptr<Impl> weak = shared_from_this();
        pollToken_ = scheduler_.scheduleEvery(core::Milliseconds(config_.pollIntervalMs),
                                              [weak, generation]() {
                                                  if (auto self = weak.lock()) {
                                                      self->tick(generation);
                                                  }
                                              });
        active_ = true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelLocked();
    }

    bool isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    bool hasPendingYield() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return yieldToken_.has_value();
    }

    size_t tickCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ticks_;
    }

private:
    void cancelLocked() {
        pollToken_.cancel();
        if (yieldToken_) {
            yieldToken_->cancel();
            yieldToken_.reset();
        }
        active_ = false;
        ++generation_;
    }

    void tick(uint64_t generation) {
        std::function<void(const InterruptionDecision&, const IntentionSignals&)> callback;
        InterruptionDecision decision;
        IntentionSignals signals;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_ || generation != generation_) {
                return;
            }
            ticks_++;

            std::optional<std::vector<float>> frame = turn_.levelSource();
            if (!frame || frame->empty()) {
                return;
            }
            signals = analyzer_.pushFrame(*frame, scheduler_.clock().now());
            if (audio::SignalSampler::micLevel(*frame) <= config_.micLevelThreshold) {
                return;
            }

            const PlaybackProgress progress = turn_.progressSource ? turn_.progressSource() : PlaybackProgress();
            decision = arbiter_.evaluate(signals, progress, turn_.crisis, turn_.recentEngagement);
            if (!decision.shouldYield) {
                return;
            }

            // One yield per turn: stop polling before acting on it
            pollToken_.cancel();
            active_ = false;
            if (decision.delayMs > 0) {
                std::weak_ptr<Impl> weak = shared_from_this();
                auto onYield = turn_.onYield;
                yieldToken_ = scheduler_.scheduleAfter(
                    core::Milliseconds(decision.delayMs),
                    [weak, generation, onYield, decision, signals]() {
                        auto self = weak.lock();
                        if (!self || !self->consumeYield(generation)) {
                            return;
                        }
                        onYield(decision, signals);
                    });
                return;
            }
            callback = turn_.onYield;
        }
        // Outside the lock so the callback may call back into the monitor
        callback(decision, signals);
    }

    bool consumeYield(uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !yieldToken_) {
            return false;
        }
        yieldToken_.reset();
        return true;
    }

    core::Scheduler& scheduler_;
    InterruptionArbiter arbiter_;
    IntentionAnalyzer analyzer_;
    InterruptionConfig config_;

    mutable std::mutex mutex_;
    PlaybackTurn turn_;
    core::CancellationToken pollToken_;
    std::optional<core::CancellationToken> yieldToken_;
    uint64_t generation_ = 0;
    size_t ticks_ = 0;
    bool active_ = false;
};

BargeInMonitor::BargeInMonitor(core::Scheduler& scheduler, const InterruptionConfig& config,
                               const audio::AudioConfig& audioConfig)
    : pImpl(std::make_shared<Impl>(scheduler, config, audioConfig)) {
}

BargeInMonitor::~BargeInMonitor() {
    pImpl->stop();
}

void BargeInMonitor::beginTurn(PlaybackTurn turn) {
    pImpl->beginTurn(std::move(turn));
}

void BargeInMonitor::stop() {
    pImpl->stop();
}

bool BargeInMonitor::isActive() const {
    return pImpl->isActive();
}

bool BargeInMonitor::hasPendingYield() const {
    return pImpl->hasPendingYield();
}

size_t BargeInMonitor::tickCount() const {
    return pImpl->tickCount();
}

} // namespace interruption
} // namespace affectrt

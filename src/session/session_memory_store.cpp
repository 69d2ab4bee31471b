#include "session/session_memory_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace affectrt {
namespace session {

namespace {

struct SessionSlot {
    explicit SessionSlot(SessionContext ctx) : context(std::move(ctx)) {}

    std::mutex mutex;
    SessionContext context;
};

float padDistance(const emotion::PADTriple& a, const emotion::PADTriple& b) {
    return (std::fabs(a.pleasure - b.pleasure) +
            std::fabs(a.arousal - b.arousal) +
            std::fabs(a.dominance - b.dominance)) / 3.0f;
}

float populationVariance(const std::vector<float>& values) {
    if (values.empty()) {
        return 0.0f;
    }
    float mean = 0.0f;
    for (float v : values) mean += v;
    mean /= static_cast<float>(values.size());
    float sum = 0.0f;
    for (float v : values) sum += (v - mean) * (v - mean);
    return sum / static_cast<float>(values.size());
}

RelationshipStage stageFor(uint64_t interactions) {
    if (interactions > 50) return RelationshipStage::CLOSE;
    if (interactions > 20) return RelationshipStage::ESTABLISHED;
    if (interactions > 5) return RelationshipStage::BUILDING;
    return RelationshipStage::NEW;
}

} // namespace

class SessionMemoryStore::Impl {
public:
    Impl(const SessionConfig& config, std::shared_ptr<core::Clock> clock)
        : config_(config), clock_(clock ? std::move(clock) : std::make_shared<core::SteadyClock>()) {
        if (config_.recentEmotionsCapacity == 0 || config_.historyCapacity == 0 ||
            config_.crisisHistoryCapacity == 0) {
            throw utils::ConfigurationException("Session ring buffer capacities must be positive");
        }
        if (!(config_.smoothingAlpha > 0.0f && config_.smoothingAlpha <= 1.0f)) {
            throw utils::ConfigurationException("smoothingAlpha must be in (0, 1]");
        }
    }

    std::shared_ptr<SessionSlot> findSlot(const std::string& sessionId) const {
        std::shared_lock<std::shared_mutex> lock(table_mutex_);
        auto it = sessions_.find(sessionId);
        return it != sessions_.end() ? it->second : nullptr;
    }

    std::shared_ptr<SessionSlot> obtainSlot(const std::string& sessionId) {
        if (sessionId.empty()) {
            throw utils::ValidationException("Session id must not be empty");
        }
        if (auto slot = findSlot(sessionId)) {
            return slot;
        }

        std::unique_lock<std::shared_mutex> lock(table_mutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            return it->second;
        }

        SessionContext context(sessionId, clock_->now(), config_.recentEmotionsCapacity,
                               config_.historyCapacity, config_.crisisHistoryCapacity);
        context.engagement = std::clamp(config_.initialEngagement, 0.0f, 1.0f);
        auto slot = std::make_shared<SessionSlot>(std::move(context));
        sessions_.emplace(sessionId, slot);
        utils::Logger::info("Created session context: " + sessionId);
        return slot;
    }

    void recordTurn(SessionContext& ctx, const emotion::EmotionalState& state,
                    const std::string& excerpt, crisis::CrisisLevel level) {
        const core::TimePoint now = clock_->now();
        const emotion::PADTriple pad = emotion::emotion_utils::clampPad(state.pad());

        if (!ctx.roleBaseline) {
            ctx.roleBaseline = config_.personaBaseline;
        }

        ctx.recentEmotions.push(EmotionRecord{state.primaryEmotion, state.intensity, pad, now});
        ctx.conversationHistory.push(HistoryEntry{
            utils::text::excerpt(excerpt, config_.excerptMaxChars), state.primaryEmotion, now});
        ctx.crisisHistory.push(level);

        const float alpha = config_.smoothingAlpha;
        ctx.baseline.pleasure = alpha * pad.pleasure + (1.0f - alpha) * ctx.baseline.pleasure;
        ctx.baseline.arousal = alpha * pad.arousal + (1.0f - alpha) * ctx.baseline.arousal;
        ctx.baseline.dominance = alpha * pad.dominance + (1.0f - alpha) * ctx.baseline.dominance;

        auto window = ctx.recentEmotions.getLatest(config_.driftWindow);
        float deviation = 0.0f;
        std::vector<float> pleasures;
        std::vector<float> arousals;
        for (const auto& record : window) {
            deviation += padDistance(record.pad, ctx.baseline);
            pleasures.push_back(record.pad.pleasure);
            arousals.push_back(record.pad.arousal);
        }
        ctx.drift = window.empty() ? 0.0f : deviation / static_cast<float>(window.size());
        ctx.emotionalStability = std::clamp(
            1.0f - (populationVariance(pleasures) + populationVariance(arousals)) / 2.0f, 0.0f, 1.0f);

        ctx.turnNumber++;
        ctx.relationshipStage = stageFor(ctx.turnNumber);
        if (state.intensity > 0.6f) {
            ctx.trustLevel = std::min(1.0f, ctx.trustLevel + 0.05f);
        }
        if (ctx.turnNumber > 10) {
            ctx.comfortLevel = std::min(1.0f, ctx.comfortLevel + 0.02f);
        }
        ctx.lastActivity = now;
    }

    SessionConfig config_;
    std::shared_ptr<core::Clock> clock_;

    mutable std::shared_mutex table_mutex_;
    std::map<std::string, std::shared_ptr<SessionSlot>> sessions_;

    std::mutex callback_mutex_;
    DriftCallback drift_callback_;

    std::mutex lifecycle_mutex_;
    std::optional<core::CancellationToken> sweep_token_;
};

SessionMemoryStore::SessionMemoryStore(const SessionConfig& config, std::shared_ptr<core::Clock> clock)
    : pImpl(std::make_unique<Impl>(config, std::move(clock))) {
}

SessionMemoryStore::~SessionMemoryStore() {
    shutdown();
}

void SessionMemoryStore::init(core::Scheduler& scheduler) {
    std::lock_guard<std::mutex> lock(pImpl->lifecycle_mutex_);
    if (pImpl->sweep_token_) {
        return;
    }

    pImpl->sweep_token_ = scheduler.scheduleEvery(
        core::Milliseconds(pImpl->config_.sweepIntervalMs),
        [this]() {
            size_t removed = sweepExpired(pImpl->clock_->now());
            if (removed > 0) {
                utils::Logger::debug("Periodic sweep removed " + std::to_string(removed) +
                                     " session(s), " + std::to_string(sessionCount()) + " remain");
            }
        });
    utils::Logger::info("Session memory store initialized (timeout " +
                        std::to_string(pImpl->config_.inactivityTimeoutMs) + " ms)");
}

void SessionMemoryStore::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycle_mutex_);
        if (pImpl->sweep_token_) {
            pImpl->sweep_token_->cancel();
            pImpl->sweep_token_.reset();
        }
    }
    std::unique_lock<std::shared_mutex> lock(pImpl->table_mutex_);
    if (!pImpl->sessions_.empty()) {
        utils::Logger::info("Session memory store shutting down, dropping " +
                            std::to_string(pImpl->sessions_.size()) + " session(s)");
    }
    pImpl->sessions_.clear();
}

bool SessionMemoryStore::isInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->lifecycle_mutex_);
    return pImpl->sweep_token_.has_value();
}

SessionContext SessionMemoryStore::getOrCreate(const std::string& sessionId) {
    auto slot = pImpl->obtainSlot(sessionId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    // a turn in flight counts as activity until it is recorded
    slot->context.lastActivity = pImpl->clock_->now();
    return slot->context;
}

std::optional<SessionContext> SessionMemoryStore::find(const std::string& sessionId) const {
    auto slot = pImpl->findSlot(sessionId);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->context;
}

void SessionMemoryStore::record(const std::string& sessionId, const emotion::EmotionalState& state,
                                const std::string& inputExcerpt, crisis::CrisisLevel crisisLevel) {
    auto slot = pImpl->obtainSlot(sessionId);

    float drift = 0.0f;
    uint64_t turn = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        pImpl->recordTurn(slot->context, state, inputExcerpt, crisisLevel);
        drift = slot->context.drift;
        turn = slot->context.turnNumber;
    }

    if (drift > pImpl->config_.driftThreshold) {
        std::ostringstream oss;
        oss << "Emotional drift " << drift << " above threshold "
            << pImpl->config_.driftThreshold << " in session " << sessionId << " (turn " << turn << ")";
        utils::Logger::warn(oss.str());

        DriftCallback callback;
        {
            std::lock_guard<std::mutex> lock(pImpl->callback_mutex_);
            callback = pImpl->drift_callback_;
        }
        if (callback) {
            try {
                callback(sessionId, drift);
            } catch (const std::exception& e) {
                utils::Logger::error("Drift callback failed for session " + sessionId + ": " + e.what());
            }
        }
    }
}

void SessionMemoryStore::applyFlow(const std::string& sessionId, const flow::FlowUpdate& update) {
    auto slot = pImpl->obtainSlot(sessionId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    SessionContext& ctx = slot->context;
    ctx.phase = update.phase;
    ctx.engagement = std::clamp(update.engagement, 0.0f, 1.0f);
    ctx.interruptionCount = update.interruptionCount;
    ctx.countdownMs = std::max<int64_t>(0, update.countdownMs);
    ctx.crisisHold = update.crisisHold;
    ctx.lastActivity = pImpl->clock_->now();
}

size_t SessionMemoryStore::sweepExpired(core::TimePoint now) {
    const core::TimePoint cutoff = now - core::Milliseconds(pImpl->config_.inactivityTimeoutMs);

    std::unique_lock<std::shared_mutex> lock(pImpl->table_mutex_);
    size_t removed = 0;
    for (auto it = pImpl->sessions_.begin(); it != pImpl->sessions_.end();) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> slotLock(it->second->mutex);
            expired = it->second->context.lastActivity < cutoff;
        }
        if (expired) {
            utils::Logger::info("Session expired: " + it->first);
            it = pImpl->sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool SessionMemoryStore::endSession(const std::string& sessionId) {
    std::unique_lock<std::shared_mutex> lock(pImpl->table_mutex_);
    bool erased = pImpl->sessions_.erase(sessionId) > 0;
    if (erased) {
        utils::Logger::info("Session ended: " + sessionId);
    }
    return erased;
}

size_t SessionMemoryStore::sessionCount() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->table_mutex_);
    return pImpl->sessions_.size();
}

void SessionMemoryStore::setDriftCallback(DriftCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->callback_mutex_);
    pImpl->drift_callback_ = std::move(callback);
}

const SessionConfig& SessionMemoryStore::getConfig() const {
    return pImpl->config_;
}

const core::Clock& SessionMemoryStore::clock() const {
    return *pImpl->clock_;
}

} // namespace session
} // namespace affectrt

#pragma once

#include "core/scheduler.hpp"
#include "session/session_context.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace affectrt {
namespace session {

/**
 * Memory store configuration
 */
struct SessionConfig {
    int64_t inactivityTimeoutMs = 30 * 60 * 1000;
    int64_t sweepIntervalMs = 60 * 1000;
    size_t recentEmotionsCapacity = 10;
    size_t historyCapacity = 20;
    size_t crisisHistoryCapacity = 10;
    size_t driftWindow = 5;
    float smoothingAlpha = 0.1f;
    float driftThreshold = 0.3f;
    size_t excerptMaxChars = 100;
    float initialEngagement = 0.5f;
    emotion::PADTriple personaBaseline{0.3f, 0.5f, 0.2f};
};

/**
 * Thread-safe table of session contexts keyed by session id.
 *
 * Lifecycle: construct, init() to start the periodic expiry sweep, shutdown()
 * to cancel it and drop every session. Sessions are created lazily by
 * getOrCreate()/record() and removed by sweepExpired() or endSession().
 * Each session has its own lock, so work on different sessions never contends
 * beyond the brief table lookup.
 */
class SessionMemoryStore {
public:
    using DriftCallback = std::function<void(const std::string& sessionId, float drift)>;

    explicit SessionMemoryStore(const SessionConfig& config = SessionConfig(),
                                std::shared_ptr<core::Clock> clock = nullptr);
    ~SessionMemoryStore();

    SessionMemoryStore(const SessionMemoryStore&) = delete;
    SessionMemoryStore& operator=(const SessionMemoryStore&) = delete;

    /**
     * Start the periodic sweep on the given scheduler. The scheduler must
     * outlive the store or shutdown() must be called first.
     */
    void init(core::Scheduler& scheduler);
    void shutdown();
    bool isInitialized() const;

    /**
     * Snapshot of the session, creating it on first use. Refreshes the
     * session's last activity so an idle sweep cannot expire it while the
     * turn that asked for the snapshot is still being processed.
     * Throws ValidationException for an empty id.
     */
    SessionContext getOrCreate(const std::string& sessionId);

    /**
     * Snapshot of an existing session without creating one
     */
    std::optional<SessionContext> find(const std::string& sessionId) const;

    /**
     * Append one turn: ring buffers, smoothed baseline, drift, relationship
     * fields and turn counter. Drift above the threshold is logged and
     * reported through the drift callback, never raised.
     */
    void record(const std::string& sessionId, const emotion::EmotionalState& state,
                const std::string& inputExcerpt,
                crisis::CrisisLevel crisisLevel = crisis::CrisisLevel::NONE);

    /**
     * Write back flow-owned fields
     */
    void applyFlow(const std::string& sessionId, const flow::FlowUpdate& update);

    /**
     * Remove sessions idle for longer than the inactivity timeout.
     * Returns the number removed; repeated calls are no-ops.
     */
    size_t sweepExpired(core::TimePoint now);

    /**
     * Explicit end-of-call. Returns false when the session did not exist.
     */
    bool endSession(const std::string& sessionId);

    size_t sessionCount() const;
    void setDriftCallback(DriftCallback callback);

    const SessionConfig& getConfig() const;
    const core::Clock& clock() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace session
} // namespace affectrt

#include "session/session_context.hpp"

namespace affectrt {
namespace session {

std::string toString(RelationshipStage stage) {
    switch (stage) {
        case RelationshipStage::NEW: return "new";
        case RelationshipStage::BUILDING: return "building";
        case RelationshipStage::ESTABLISHED: return "established";
        case RelationshipStage::CLOSE: return "close";
    }
    return "new";
}

SessionContext::SessionContext(const std::string& id, core::TimePoint now,
                               size_t emotionCapacity, size_t historyCapacity,
                               size_t crisisCapacity)
    : sessionId(id),
      createdAt(now),
      lastActivity(now),
      recentEmotions(emotionCapacity),
      conversationHistory(historyCapacity),
      crisisHistory(crisisCapacity),
      baseline(emotion::emotion_utils::profileFor(emotion::EmotionCategory::NEUTRAL)) {
}

} // namespace session
} // namespace affectrt

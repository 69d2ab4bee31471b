#pragma once

#include <map>
#include <string>
#include <vector>

namespace affectrt {
namespace crisis {

enum class CrisisLevel {
    NONE = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    CRITICAL = 4
};

enum class Urgency {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    IMMEDIATE = 3
};

enum class CrisisCategory {
    SUICIDAL,
    SELF_HARM,
    HOPELESSNESS,
    ISOLATION,
    SUBSTANCE,
    VIOLENCE,
    ACUTE_DISTRESS
};

/**
 * Per-turn risk estimate. Derived every turn and never stored, apart from
 * its level which feeds the session's crisis history.
 */
struct CrisisAssessment {
    float textRisk = 0.0f;
    float voiceRisk = 0.0f;
    float behavioralRisk = 0.0f;
    float overallRisk = 0.0f;
    CrisisLevel level = CrisisLevel::NONE;
    float confidence = 0.0f;
    Urgency urgency = Urgency::LOW;

    std::map<CrisisCategory, float> categoryScores;
    std::vector<std::string> indicators;          // matched phrases, "category:phrase"
    std::vector<std::string> recommendedActions;

    /**
     * True when the turn should be escalated to a human or crisis resource
     */
    bool requiresEscalation() const {
        return level >= CrisisLevel::HIGH || urgency >= Urgency::HIGH;
    }

    float categoryScore(CrisisCategory category) const;

    static CrisisAssessment none();

    /**
     * Fallback when assessment itself fails: medium/medium, never none.
     */
    static CrisisAssessment cautiousFallback();
};

namespace crisis_utils {

std::string toString(CrisisLevel level);
std::string toString(Urgency urgency);
std::string toString(CrisisCategory category);

} // namespace crisis_utils

} // namespace crisis
} // namespace affectrt

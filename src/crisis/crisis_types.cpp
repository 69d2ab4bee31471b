#include "crisis/crisis_types.hpp"

namespace affectrt {
namespace crisis {

float CrisisAssessment::categoryScore(CrisisCategory category) const {
    auto it = categoryScores.find(category);
    return it != categoryScores.end() ? it->second : 0.0f;
}

CrisisAssessment CrisisAssessment::none() {
    CrisisAssessment assessment;
    assessment.level = CrisisLevel::NONE;
    assessment.urgency = Urgency::LOW;
    assessment.recommendedActions = {"continue supportive conversation"};
    return assessment;
}

CrisisAssessment CrisisAssessment::cautiousFallback() {
    CrisisAssessment assessment;
    assessment.level = CrisisLevel::MEDIUM;
    assessment.urgency = Urgency::MEDIUM;
    assessment.confidence = 0.0f;
    assessment.indicators = {"assessment_unavailable"};
    assessment.recommendedActions = {"check in on the user's wellbeing",
                                     "offer support resources"};
    return assessment;
}

namespace crisis_utils {

std::string toString(CrisisLevel level) {
    switch (level) {
        case CrisisLevel::NONE: return "none";
        case CrisisLevel::LOW: return "low";
        case CrisisLevel::MEDIUM: return "medium";
        case CrisisLevel::HIGH: return "high";
        case CrisisLevel::CRITICAL: return "critical";
    }
    return "none";
}

std::string toString(Urgency urgency) {
    switch (urgency) {
        case Urgency::LOW: return "low";
        case Urgency::MEDIUM: return "medium";
        case Urgency::HIGH: return "high";
        case Urgency::IMMEDIATE: return "immediate";
    }
    return "low";
}

std::string toString(CrisisCategory category) {
    switch (category) {
        case CrisisCategory::SUICIDAL: return "suicidal";
        case CrisisCategory::SELF_HARM: return "self_harm";
        case CrisisCategory::HOPELESSNESS: return "hopelessness";
        case CrisisCategory::ISOLATION: return "isolation";
        case CrisisCategory::SUBSTANCE: return "substance";
        case CrisisCategory::VIOLENCE: return "violence";
        case CrisisCategory::ACUTE_DISTRESS: return "acute_distress";
    }
    return "unknown";
}

} // namespace crisis_utils

} // namespace crisis
} // namespace affectrt

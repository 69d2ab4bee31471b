#include "crisis/crisis_risk_assessor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace affectrt {
namespace crisis {

namespace {

// Importance weights of the category scores in the text sub-score.
// Isolation and substance are reported but do not contribute.
float textImportance(CrisisCategory category) {
    switch (category) {
        case CrisisCategory::SUICIDAL: return 0.30f;
        case CrisisCategory::SELF_HARM: return 0.25f;
        case CrisisCategory::HOPELESSNESS: return 0.20f;
        case CrisisCategory::VIOLENCE: return 0.15f;
        case CrisisCategory::ACUTE_DISTRESS: return 0.10f;
        default: return 0.0f;
    }
}

float levelValue(CrisisLevel level) {
    return static_cast<float>(static_cast<int>(level));
}

float clamp01(float value) {
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::clamp(value, 0.0f, 1.0f);
}

} // namespace

bool CrisisConfig::isValid() const {
    const bool ordered = lowThreshold >= 0.0f && lowThreshold < mediumThreshold &&
                         mediumThreshold < highThreshold && highThreshold < criticalThreshold &&
                         criticalThreshold <= 1.0f;
    const float weightSum = textWeight + voiceWeight + behavioralWeight;
    return ordered && textWeight >= 0.0f && voiceWeight >= 0.0f && behavioralWeight >= 0.0f &&
           std::fabs(weightSum - 1.0f) <= 1e-3f && behavioralWindow > 0;
}

CrisisRiskAssessor::CrisisRiskAssessor(const CrisisConfig& config) : config_(config) {
    if (!config_.isValid()) {
        throw utils::ConfigurationException("Invalid crisis configuration",
                                            "thresholds must increase within [0,1] and weights sum to 1");
    }
}

const std::vector<CrisisKeywordTable>& CrisisRiskAssessor::keywordTables() {
    static const std::vector<CrisisKeywordTable> tables = {
        {CrisisCategory::SUICIDAL, 0.9f,
         {"kill myself", "end my life", "want to die", "suicide", "take my life",
          "don't want to live", "better off dead", "no reason to live",
          "end it all", "give up", "can't go on", "tired of living"}},
        {CrisisCategory::SELF_HARM, 0.8f,
         {"hurt myself", "cut myself", "self harm", "self injury", "bleeding",
          "scars", "burn myself", "hit myself", "bang my head"}},
        {CrisisCategory::HOPELESSNESS, 0.7f,
         {"hopeless", "helpless", "worthless", "useless", "no hope",
          "nothing matters", "pointless", "meaningless", "no future",
          "everything is wrong", "can't fix this", "no way out"}},
        {CrisisCategory::ISOLATION, 0.6f,
         {"alone", "lonely", "no friends", "no one cares", "no one understands",
          "isolated", "abandoned", "rejected", "no support", "no one to talk to"}},
        {CrisisCategory::SUBSTANCE, 0.6f,
         {"drunk", "high", "drugs", "alcohol", "overdose", "substance",
          "medication", "pills", "smoking", "drinking too much"}},
        {CrisisCategory::VIOLENCE, 0.8f,
         {"hurt someone", "kill someone", "attack", "violent", "rage",
          "angry", "furious", "hate", "revenge", "payback"}},
        {CrisisCategory::ACUTE_DISTRESS, 0.7f,
         {"panic", "anxiety attack", "can't breathe", "heart racing",
          "overwhelmed", "breaking down", "losing control", "freaking out",
          "mental breakdown", "nervous breakdown"}},
    };
    return tables;
}

const std::vector<std::string>& CrisisRiskAssessor::directCrisisPhrases() {
    static const std::vector<std::string> phrases = {
        "kill myself", "want to die", "end it all", "suicide", "hurt myself", "no reason to live"};
    return phrases;
}

std::vector<std::string> CrisisRiskAssessor::recommendedActionsFor(CrisisLevel level) {
    switch (level) {
        case CrisisLevel::CRITICAL:
            return {"provide crisis hotline information", "encourage immediate professional help",
                    "stay with the user"};
        case CrisisLevel::HIGH:
            return {"offer emotional support", "suggest professional counseling"};
        case CrisisLevel::MEDIUM:
            return {"continue supportive conversation", "monitor for escalation"};
        case CrisisLevel::LOW:
            return {"maintain supportive presence", "encourage healthy coping strategies"};
        case CrisisLevel::NONE:
        default:
            return {"continue normal conversation"};
    }
}

float CrisisRiskAssessor::scoreText(const std::string& normalizedText, CrisisAssessment& assessment) const {
    float total = 0.0f;
    for (const auto& table : keywordTables()) {
        size_t matches = 0;
        for (const auto& keyword : table.keywords) {
            if (utils::text::containsPhrase(normalizedText, keyword)) {
                ++matches;
                assessment.indicators.push_back(crisis_utils::toString(table.category) + ":" + keyword);
            }
        }
        const float score = std::min(1.0f, static_cast<float>(matches) /
                                               static_cast<float>(table.keywords.size()) * table.weight);
        assessment.categoryScores[table.category] = score;
        total += textImportance(table.category) * score;
    }
    return clamp01(total);
}

float CrisisRiskAssessor::scoreVoice(const std::optional<audio::AudioFeatures>& voice) const {
    if (!voice || !voice->present) {
        return 0.0f;
    }
    const auto& v = *voice;
    return clamp01(clamp01(v.stress) * 0.25f +
                   clamp01(v.breathIrregularity) * 0.20f +
                   clamp01(v.tremor) * 0.20f +
                   clamp01(v.pitchInstability) * 0.15f +
                   clamp01(v.volumeInconsistency) * 0.10f +
                   clamp01(v.speechRate) * 0.10f);
}

float CrisisRiskAssessor::scoreBehavior(const std::vector<CrisisLevel>& history) const {
    if (history.size() < 2) {
        return 0.0f;
    }

    std::vector<float> levels;
    levels.reserve(history.size());
    for (CrisisLevel level : history) {
        levels.push_back(levelValue(level));
    }

    // Mood swings: spread of the recent levels
    float moodSwings = 0.0f;
    if (levels.size() >= 3) {
        float mean = 0.0f;
        for (float l : levels) {
            mean += l;
        }
        mean /= static_cast<float>(levels.size());
        float variance = 0.0f;
        for (float l : levels) {
            variance += (l - mean) * (l - mean);
        }
        variance /= static_cast<float>(levels.size());
        moodSwings = std::min(1.0f, std::sqrt(variance) / 4.0f);
    }

    // Agitation: the last three levels never decrease and end above none
    float agitation = 0.0f;
    if (levels.size() >= 3) {
        const size_t start = levels.size() - 3;
        bool nonDecreasing = true;
        for (size_t i = start + 1; i < levels.size(); ++i) {
            if (levels[i] < levels[i - 1]) {
                nonDecreasing = false;
                break;
            }
        }
        agitation = (nonDecreasing && levels.back() > 0.0f) ? 0.7f : 0.2f;
    }

    // Impulsivity: jumps of two or more levels between consecutive turns
    float impulsivity = 0.0f;
    if (levels.size() >= 3) {
        size_t spikes = 0;
        for (size_t i = 1; i < levels.size(); ++i) {
            if (levels[i] - levels[i - 1] >= 2.0f) {
                ++spikes;
            }
        }
        impulsivity = std::min(1.0f, static_cast<float>(spikes) / static_cast<float>(levels.size()));
    }

    // Withdrawal has no signal source in this core and contributes zero
    const float withdrawal = 0.0f;

    return clamp01(moodSwings * 0.30f + withdrawal * 0.25f + agitation * 0.25f + impulsivity * 0.20f);
}

CrisisLevel CrisisRiskAssessor::levelFor(float overallRisk) const {
    if (overallRisk >= config_.criticalThreshold) return CrisisLevel::CRITICAL;
    if (overallRisk >= config_.highThreshold) return CrisisLevel::HIGH;
    if (overallRisk >= config_.mediumThreshold) return CrisisLevel::MEDIUM;
    if (overallRisk >= config_.lowThreshold) return CrisisLevel::LOW;
    return CrisisLevel::NONE;
}

Urgency CrisisRiskAssessor::urgencyFor(CrisisLevel level, const CrisisAssessment& assessment) const {
    if (level == CrisisLevel::CRITICAL ||
        assessment.categoryScore(CrisisCategory::SUICIDAL) > config_.suicidalImmediateScore) {
        return Urgency::IMMEDIATE;
    }
    if (level == CrisisLevel::HIGH ||
        assessment.categoryScore(CrisisCategory::SELF_HARM) > config_.selfHarmHighScore) {
        return Urgency::HIGH;
    }
    if (level == CrisisLevel::MEDIUM) {
        return Urgency::MEDIUM;
    }
    return Urgency::LOW;
}

CrisisAssessment CrisisRiskAssessor::assess(const std::string& text,
                                            const std::optional<audio::AudioFeatures>& voice,
                                            const session::SessionContext& context) const {
    CrisisAssessment assessment;
    const std::string normalized = utils::text::normalize(text);

    assessment.textRisk = scoreText(normalized, assessment);
    assessment.voiceRisk = scoreVoice(voice);
    assessment.behavioralRisk = scoreBehavior(context.crisisHistory.getLatest(config_.behavioralWindow));
    assessment.overallRisk = clamp01(config_.textWeight * assessment.textRisk +
                                     config_.voiceWeight * assessment.voiceRisk +
                                     config_.behavioralWeight * assessment.behavioralRisk);

    CrisisLevel level = levelFor(assessment.overallRisk);

    // Floors only ever raise the level
    const bool directPhrase = utils::text::countPhrases(normalized, directCrisisPhrases()) > 0;
    if (assessment.categoryScore(CrisisCategory::SUICIDAL) > 0.0f || directPhrase) {
        level = CrisisLevel::CRITICAL;
    } else if (assessment.categoryScore(CrisisCategory::SELF_HARM) > 0.0f) {
        level = std::max(level, CrisisLevel::HIGH);
    }
    assessment.level = level;
    assessment.urgency = urgencyFor(level, assessment);

    const float textConfidence = assessment.textRisk > 0.5f ? 0.8f : 0.3f;
    const float voiceConfidence = assessment.voiceRisk > 0.5f ? 0.7f : 0.4f;
    const float behavioralConfidence = assessment.behavioralRisk > 0.5f ? 0.6f : 0.3f;
    assessment.confidence = (textConfidence + voiceConfidence + behavioralConfidence) / 3.0f;

    assessment.recommendedActions = recommendedActionsFor(level);

    if (level >= CrisisLevel::HIGH) {
        std::ostringstream oss;
        oss << "Crisis level " << crisis_utils::toString(level) << " (urgency "
            << crisis_utils::toString(assessment.urgency) << ") for session " << context.sessionId
            << ", " << assessment.indicators.size() << " indicators";
        utils::Logger::warn(oss.str());
    } else {
        utils::Logger::debug("Crisis assessment for " + context.sessionId + ": overall risk " +
                             std::to_string(assessment.overallRisk));
    }
    return assessment;
}

} // namespace crisis
} // namespace affectrt

#pragma once

#include "audio/signal_sampler.hpp"
#include "crisis/crisis_types.hpp"
#include "session/session_context.hpp"
#include <optional>
#include <string>
#include <vector>

namespace affectrt {
namespace crisis {

/**
 * Level thresholds and sub-score weights
 */
struct CrisisConfig {
    float lowThreshold = 0.2f;
    float mediumThreshold = 0.4f;
    float highThreshold = 0.6f;
    float criticalThreshold = 0.8f;

    float textWeight = 0.6f;
    float voiceWeight = 0.25f;
    float behavioralWeight = 0.15f;

    float suicidalImmediateScore = 0.7f;
    float selfHarmHighScore = 0.6f;
    size_t behavioralWindow = 10;

    bool isValid() const;
};

struct CrisisKeywordTable {
    CrisisCategory category;
    float weight;
    std::vector<std::string> keywords;
};

/**
 * Scores text, voice and behavioral indicators into a weighted risk estimate.
 *
 * Missing voice features contribute zero. Explicit suicidal or self-harm
 * statements raise the level to a floor the weighted density alone could
 * not reach.
 */
class CrisisRiskAssessor {
public:
    explicit CrisisRiskAssessor(const CrisisConfig& config = CrisisConfig());
    virtual ~CrisisRiskAssessor() = default;

    virtual CrisisAssessment assess(const std::string& text,
                            const std::optional<audio::AudioFeatures>& voice,
                            const session::SessionContext& context) const;

    // Sub-scores, exposed for testing
    float scoreText(const std::string& normalizedText, CrisisAssessment& assessment) const;
    float scoreVoice(const std::optional<audio::AudioFeatures>& voice) const;
    float scoreBehavior(const std::vector<CrisisLevel>& history) const;

    CrisisLevel levelFor(float overallRisk) const;

    const CrisisConfig& getConfig() const { return config_; }

    static const std::vector<CrisisKeywordTable>& keywordTables();
    static const std::vector<std::string>& directCrisisPhrases();
    static std::vector<std::string> recommendedActionsFor(CrisisLevel level);

private:
    Urgency urgencyFor(CrisisLevel level, const CrisisAssessment& assessment) const;

    CrisisConfig config_;
};

} // namespace crisis
} // namespace affectrt

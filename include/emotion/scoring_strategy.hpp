#pragma once

#include "emotion/emotion_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace affectrt {
namespace emotion {

/**
 * Lexical detector seam of the fusion engine. Implementations return
 * candidates tagged SourceKind::LEXICAL; thresholding and ranking stay in
 * the engine.
 */
class ScoringStrategy {
public:
    virtual ~ScoringStrategy() = default;
    virtual std::vector<EmotionCandidate> score(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Per-emotion vocabulary: direct keywords and weaker context phrases
 */
struct EmotionLexicon {
    std::vector<std::string> keywords;
    std::vector<std::string> contextual;
};

/**
 * Keyword/phrase membership scoring.
 *
 *   intensity  = min(1, (kw + 0.5 * ctx) / max(1, |keywords| / 3))
 *   confidence = min(1, intensity * (1 + 0.15 * (kw + ctx)))
 */
class KeywordScoringStrategy : public ScoringStrategy {
public:
    KeywordScoringStrategy();
    explicit KeywordScoringStrategy(std::map<EmotionCategory, EmotionLexicon> lexicon);

    std::vector<EmotionCandidate> score(const std::string& text) const override;
    std::string name() const override { return "keyword"; }

    static const std::map<EmotionCategory, EmotionLexicon>& defaultLexicon();

private:
    std::map<EmotionCategory, EmotionLexicon> lexicon_;
};

} // namespace emotion
} // namespace affectrt

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace affectrt {
namespace emotion {

/**
 * Closed emotion taxonomy shared by fusion, memory and voice mapping
 */
enum class EmotionCategory {
    NEUTRAL,
    JOY,
    SADNESS,
    ANGER,
    ANXIETY,
    SURPRISE,
    FEAR,
    DISGUST,
    CONTEMPT,
    RELIEF,
    PRIDE,
    BITTERSWEET,
    NOSTALGIC,
    CURIOUS,
    INTIMATE
};

/**
 * Detector that produced a candidate. Ranking priority is
 * OVERRIDE > LEXICAL > CONTEXTUAL == PROSODIC.
 */
enum class SourceKind {
    CONTEXTUAL,
    PROSODIC,
    LEXICAL,
    OVERRIDE
};

/**
 * Pleasure-Arousal-Dominance triple.
 * pleasure and dominance in [-1, 1], arousal in [0, 1].
 */
struct PADTriple {
    float pleasure = 0.0f;
    float arousal = 0.5f;
    float dominance = 0.0f;
};

struct EmotionCandidate {
    EmotionCategory emotion = EmotionCategory::NEUTRAL;
    float confidence = 0.0f;
    float intensity = 0.0f;
    SourceKind source = SourceKind::CONTEXTUAL;
};

/**
 * Fused estimate for one utterance.
 *
 * detectedCandidates is ordered by (source priority, confidence) descending and
 * primaryEmotion is always the first candidate's emotion, or NEUTRAL when the
 * list is empty.
 */
struct EmotionalState {
    float pleasure = 0.0f;
    float arousal = 0.5f;
    float dominance = 0.0f;
    EmotionCategory primaryEmotion = EmotionCategory::NEUTRAL;
    EmotionCategory secondaryEmotion = EmotionCategory::NEUTRAL;
    float intensity = 0.5f;
    float confidence = 0.5f;
    bool isBlended = false;
    bool sarcasmSuspected = false;
    std::vector<EmotionCandidate> detectedCandidates;

    PADTriple pad() const { return PADTriple{pleasure, arousal, dominance}; }

    /**
     * Neutral baseline state used when nothing clears the confidence threshold
     * and as the fusion stage fallback.
     */
    static EmotionalState neutral(float confidence = 0.5f, float intensity = 0.5f);
};

namespace emotion_utils {

std::string toString(EmotionCategory emotion);
std::optional<EmotionCategory> fromString(const std::string& name);
std::string toString(SourceKind source);

/**
 * Every category in declaration order.
 */
const std::vector<EmotionCategory>& allCategories();

/**
 * Reference PAD profile of a category.
 */
PADTriple profileFor(EmotionCategory emotion);

int sourcePriority(SourceKind source);

/**
 * Negative-valence categories (pleasure < 0 in their profile).
 */
bool isNegative(EmotionCategory emotion);

PADTriple clampPad(const PADTriple& pad);

/**
 * Sum of absolute per-axis differences.
 */
float padDistance(const PADTriple& a, const PADTriple& b);

} // namespace emotion_utils

} // namespace emotion
} // namespace affectrt

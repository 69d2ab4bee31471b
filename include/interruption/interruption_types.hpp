#pragma once

#include <cstdint>
#include <string>

namespace affectrt {
namespace interruption {

/**
 * Intention-to-interrupt evidence for the current playback window, each in [0, 1]
 */
struct IntentionSignals {
    float breathIntake = 0.0f;
    float micromovement = 0.0f;
    float backgroundPrep = 0.0f;
    float pausePatternLikelihood = 0.5f;
    float urgency = 0.0f;
};

enum class ResumeStrategy {
    CONTINUE,
    SUMMARIZE,
    REDIRECT,
    PAUSE_INDEFINITELY
};

/**
 * Where synthesized playback currently is
 */
struct PlaybackProgress {
    std::string spokenText;        // everything played so far
    std::string currentSentence;   // full text of the sentence being played
    size_t wordsSpoken = 0;        // words of currentSentence already played
    size_t totalWords = 0;         // words in currentSentence

    float sentenceProgress() const {
        if (totalWords == 0 || wordsSpoken >= totalWords) {
            return 1.0f;
        }
        return static_cast<float>(wordsSpoken) / static_cast<float>(totalWords);
    }
};

struct InterruptionDecision {
    bool shouldYield = false;
    float confidence = 0.0f;
    int64_t delayMs = 0;
    ResumeStrategy resumeStrategy = ResumeStrategy::CONTINUE;
};

std::string toString(ResumeStrategy strategy);

} // namespace interruption
} // namespace affectrt

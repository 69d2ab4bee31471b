#include "emotion/scoring_strategy.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>

namespace affectrt {
namespace emotion {

using utils::text::countPhrases;
using utils::text::normalize;

const std::map<EmotionCategory, EmotionLexicon>& KeywordScoringStrategy::defaultLexicon() {
    static const std::map<EmotionCategory, EmotionLexicon> lexicon = {
        {EmotionCategory::JOY, {
            {"happy", "joy", "excited", "thrilled", "amazing", "wonderful", "great", "love", "good",
             "nice", "fantastic", "brilliant", "awesome", "delighted", "ecstatic"},
            {"laugh", "smile", "cheer", "celebrate", "win", "success", "achievement"}}},
        {EmotionCategory::SADNESS, {
            {"sad", "depressed", "down", "lonely", "hurt", "crying", "empty", "hopeless", "bad",
             "terrible", "miserable", "grief", "heartbroken", "devastated"},
            {"miss", "lost", "gone", "alone", "nobody", "never", "always"}}},
        {EmotionCategory::ANGER, {
            {"angry", "mad", "furious", "hate", "annoyed", "frustrated", "rage", "upset", "livid",
             "enraged", "irritated", "pissed"},
            {"unfair", "wrong", "stupid", "idiot", "never", "always", "everyone"}}},
        {EmotionCategory::ANXIETY, {
            {"anxious", "worried", "scared", "nervous", "panic", "stress", "overwhelmed", "afraid",
             "fear", "terrified", "dread", "anxiety"},
            {"what if", "maybe", "could", "might", "should", "need to", "have to"}}},
        {EmotionCategory::SURPRISE, {
            {"surprised", "shocked", "amazed", "astonished", "stunned", "wow", "unexpected",
             "incredible", "unbelievable", "omg"},
            {"really", "seriously", "no way", "what", "how"}}},
        {EmotionCategory::FEAR, {
            {"fear", "terrified", "horrified", "petrified", "dread", "terror", "scared", "afraid",
             "frightened"},
            {"danger", "threat", "attack", "kill", "die", "hurt", "pain", "dangerous"}}},
        {EmotionCategory::DISGUST, {
            {"disgusted", "revolted", "sickened", "gross", "nasty", "repulsive", "awful", "terrible"},
            {"ew", "yuck", "disgusting"}}},
        {EmotionCategory::CONTEMPT, {
            {"contempt", "disdain", "scorn", "mock", "ridicule", "sarcastic", "hate", "despise",
             "loathe"},
            {"whatever", "yeah right", "sure", "obviously"}}},
        {EmotionCategory::RELIEF, {
            {"relieved", "thankful", "grateful", "peaceful", "calm", "serene", "better", "okay",
             "phew"},
            {"finally", "at last", "thank god", "good"}}},
        {EmotionCategory::PRIDE, {
            {"proud", "accomplished", "achieved", "successful", "confident", "triumphant", "did it",
             "made it"},
            {"finally", "succeeded", "won", "completed"}}},
        {EmotionCategory::BITTERSWEET, {
            {"bittersweet", "mixed feelings", "conflicted", "torn", "complicated", "confused"},
            {"but", "however", "though", "although", "mixed"}}},
        {EmotionCategory::NOSTALGIC, {
            {"remember", "back then", "good old days", "nostalgic", "miss", "used to"},
            {"remember when", "back in the day", "those were the days"}}},
        {EmotionCategory::CURIOUS, {
            {"wonder", "curious", "interesting", "tell me more", "what", "how", "why"},
            {"really", "tell me", "what happened"}}},
    };
    return lexicon;
}

KeywordScoringStrategy::KeywordScoringStrategy() : lexicon_(defaultLexicon()) {
}

KeywordScoringStrategy::KeywordScoringStrategy(std::map<EmotionCategory, EmotionLexicon> lexicon)
    : lexicon_(std::move(lexicon)) {
}

std::vector<EmotionCandidate> KeywordScoringStrategy::score(const std::string& text) const {
    const std::string normalized = normalize(text);
    std::vector<EmotionCandidate> candidates;

    for (const auto& [emotion, entry] : lexicon_) {
        const size_t keywordMatches = countPhrases(normalized, entry.keywords);
        const size_t contextMatches = countPhrases(normalized, entry.contextual);
        if (keywordMatches == 0 && contextMatches == 0) {
            continue;
        }

        const float scale = std::max(1.0f, static_cast<float>(entry.keywords.size()) / 3.0f);
        const float intensity = std::min(
            1.0f, (static_cast<float>(keywordMatches) + 0.5f * static_cast<float>(contextMatches)) / scale);
        const float confidence = std::min(
            1.0f, intensity * (1.0f + 0.15f * static_cast<float>(keywordMatches + contextMatches)));

        candidates.push_back(EmotionCandidate{emotion, confidence, intensity, SourceKind::LEXICAL});
    }
    return candidates;
}

} // namespace emotion
} // namespace affectrt

#include "emotion/emotion_types.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace affectrt {
namespace emotion {

EmotionalState EmotionalState::neutral(float confidence, float intensity) {
    EmotionalState state;
    PADTriple pad = emotion_utils::profileFor(EmotionCategory::NEUTRAL);
    state.pleasure = pad.pleasure;
    state.arousal = pad.arousal;
    state.dominance = pad.dominance;
    state.confidence = confidence;
    state.intensity = intensity;
    return state;
}

namespace emotion_utils {

namespace {

struct CategoryInfo {
    const char* name;
    PADTriple profile;
};

const std::map<EmotionCategory, CategoryInfo>& categoryTable() {
    static const std::map<EmotionCategory, CategoryInfo> table = {
        {EmotionCategory::NEUTRAL,     {"neutral",     {0.0f, 0.5f, 0.0f}}},
        {EmotionCategory::JOY,         {"joy",         {0.9f, 0.7f, 0.6f}}},
        {EmotionCategory::SADNESS,     {"sadness",     {-0.8f, 0.2f, -0.3f}}},
        {EmotionCategory::ANGER,       {"anger",       {-0.4f, 0.9f, 0.2f}}},
        {EmotionCategory::ANXIETY,     {"anxiety",     {-0.6f, 0.8f, -0.4f}}},
        {EmotionCategory::SURPRISE,    {"surprise",    {0.3f, 0.8f, 0.1f}}},
        {EmotionCategory::FEAR,        {"fear",        {-0.9f, 0.9f, -0.8f}}},
        {EmotionCategory::DISGUST,     {"disgust",     {-0.9f, 0.6f, -0.2f}}},
        {EmotionCategory::CONTEMPT,    {"contempt",    {-0.7f, 0.4f, 0.3f}}},
        {EmotionCategory::RELIEF,      {"relief",      {0.7f, 0.2f, 0.4f}}},
        {EmotionCategory::PRIDE,       {"pride",       {0.8f, 0.6f, 0.8f}}},
        {EmotionCategory::BITTERSWEET, {"bittersweet", {0.1f, 0.5f, 0.0f}}},
        {EmotionCategory::NOSTALGIC,   {"nostalgic",   {0.4f, 0.3f, 0.2f}}},
        {EmotionCategory::CURIOUS,     {"curious",     {0.3f, 0.6f, 0.1f}}},
        {EmotionCategory::INTIMATE,    {"intimate",    {0.5f, 0.3f, 0.1f}}},
    };
    return table;
}

} // namespace

std::string toString(EmotionCategory emotion) {
    auto it = categoryTable().find(emotion);
    return it != categoryTable().end() ? it->second.name : "neutral";
}

std::optional<EmotionCategory> fromString(const std::string& name) {
    for (const auto& [category, info] : categoryTable()) {
        if (name == info.name) {
            return category;
        }
    }
    return std::nullopt;
}

std::string toString(SourceKind source) {
    switch (source) {
        case SourceKind::CONTEXTUAL: return "contextual";
        case SourceKind::PROSODIC: return "prosodic";
        case SourceKind::LEXICAL: return "lexical";
        case SourceKind::OVERRIDE: return "override";
    }
    return "contextual";
}

const std::vector<EmotionCategory>& allCategories() {
    static const std::vector<EmotionCategory> categories = [] {
        std::vector<EmotionCategory> all;
        for (const auto& entry : categoryTable()) {
            all.push_back(entry.first);
        }
        return all;
    }();
    return categories;
}

PADTriple profileFor(EmotionCategory emotion) {
    auto it = categoryTable().find(emotion);
    return it != categoryTable().end() ? it->second.profile : PADTriple{};
}

int sourcePriority(SourceKind source) {
    switch (source) {
        case SourceKind::OVERRIDE: return 3;
        case SourceKind::LEXICAL: return 2;
        case SourceKind::CONTEXTUAL:
        case SourceKind::PROSODIC:
            return 1;
    }
    return 1;
}

bool isNegative(EmotionCategory emotion) {
    return profileFor(emotion).pleasure < 0.0f;
}

PADTriple clampPad(const PADTriple& pad) {
    auto finiteOr = [](float value, float fallback) {
        return std::isfinite(value) ? value : fallback;
    };
    PADTriple clamped;
    clamped.pleasure = std::clamp(finiteOr(pad.pleasure, 0.0f), -1.0f, 1.0f);
    clamped.arousal = std::clamp(finiteOr(pad.arousal, 0.5f), 0.0f, 1.0f);
    clamped.dominance = std::clamp(finiteOr(pad.dominance, 0.0f), -1.0f, 1.0f);
    return clamped;
}

float padDistance(const PADTriple& a, const PADTriple& b) {
    return std::fabs(a.pleasure - b.pleasure) + std::fabs(a.arousal - b.arousal) +
           std::fabs(a.dominance - b.dominance);
}

} // namespace emotion_utils

} // namespace emotion
} // namespace affectrt

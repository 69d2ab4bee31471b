#include "core/prompt_context.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace affectrt {
namespace core {

namespace {

std::string formatLevel(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

PromptContext PromptContext::build(const session::SessionContext& context,
                                   const emotion::EmotionalState& state,
                                   const crisis::CrisisAssessment& crisis,
                                   const flow::FlowDecision& decision) {
    PromptContext prompt;
    prompt.set("relationship_stage", session::toString(context.relationshipStage));
    prompt.set("trust_level", formatLevel(context.trustLevel));
    prompt.set("comfort_level", formatLevel(context.comfortLevel));

    std::string recent;
    for (const auto& record : context.recentEmotions.getLatest(5)) {
        if (!recent.empty()) {
            recent += ", ";
        }
        recent += emotion::emotion_utils::toString(record.emotion);
    }
    prompt.set("recent_emotions", recent.empty() ? "none" : recent);

    prompt.set("current_emotion", emotion::emotion_utils::toString(state.primaryEmotion));
    if (state.isBlended) {
        prompt.set("secondary_emotion", emotion::emotion_utils::toString(state.secondaryEmotion));
    }
    if (state.sarcasmSuspected) {
        prompt.set("sarcasm_suspected", "true");
    }
    prompt.set("crisis_level", crisis::crisis_utils::toString(crisis.level));
    prompt.set("flow_action", flow::flow_utils::toString(decision.action));
    return prompt;
}

void PromptContext::set(const std::string& key, const std::string& value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const std::pair<std::string, std::string>& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = value;
    } else {
        entries_.emplace_back(key, value);
    }
}

std::string PromptContext::get(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const std::pair<std::string, std::string>& e) { return e.first == key; });
    return it != entries_.end() ? it->second : std::string();
}

bool PromptContext::has(const std::string& key) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&key](const std::pair<std::string, std::string>& e) { return e.first == key; });
}

std::string PromptContext::render() const {
    std::ostringstream oss;
    for (const auto& entry : entries_) {
        oss << entry.first << ": " << entry.second << "\n";
    }
    return oss.str();
}

} // namespace core
} // namespace affectrt

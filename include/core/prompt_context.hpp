#pragma once

#include "crisis/crisis_types.hpp"
#include "emotion/emotion_types.hpp"
#include "flow/flow_types.hpp"
#include "session/session_context.hpp"
#include <string>
#include <utility>
#include <vector>

namespace affectrt {
namespace core {

/**
 * Enumerated key/value context embedded in the text-generation prompt
 */
class PromptContext {
public:
    PromptContext() = default;

    static PromptContext build(const session::SessionContext& context,
                               const emotion::EmotionalState& state,
                               const crisis::CrisisAssessment& crisis,
                               const flow::FlowDecision& decision);

    void set(const std::string& key, const std::string& value);
    std::string get(const std::string& key) const;
    bool has(const std::string& key) const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

    /**
     * One "key: value" line per entry, in insertion order
     */
    std::string render() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace core
} // namespace affectrt

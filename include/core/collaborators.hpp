#pragma once

#include "voice/voice_behavior_mapper.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace affectrt {
namespace core {

struct TranscriptionResult {
    std::string text;
    float confidence;
    bool success;
    std::string error_message;

    TranscriptionResult() : confidence(0.0f), success(false) {}
    TranscriptionResult(const std::string& t, float conf) : text(t), confidence(conf), success(true) {}
};

struct SynthesisResult {
    std::vector<float> audio;
    uint32_t sample_rate;
    float duration_ms;
    bool success;
    std::string error_message;

    SynthesisResult() : sample_rate(0), duration_ms(0.0f), success(false) {}
};

struct ConversationTurn {
    std::string speaker;   // "user" or "assistant"
    std::string text;
};

/**
 * Speech recognition service boundary. An empty transcription is "no input
 * this turn", not an error.
 */
class SpeechToText {
public:
    virtual ~SpeechToText() = default;
    virtual TranscriptionResult transcribe(const std::vector<float>& audio, uint32_t sampleRate) = 0;
};

/**
 * Chat-completion service boundary
 */
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate(const std::string& systemPrompt,
                                 const std::vector<ConversationTurn>& history,
                                 const std::string& latestUserText) = 0;
};

/**
 * Speech synthesis service boundary
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual SynthesisResult synthesize(const std::string& text, const voice::VoiceParams& params) = 0;
};

} // namespace core
} // namespace affectrt

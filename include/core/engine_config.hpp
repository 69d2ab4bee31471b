#pragma once

#include "audio/signal_sampler.hpp"
#include "crisis/crisis_risk_assessor.hpp"
#include "emotion/emotion_fusion_engine.hpp"
#include "flow/conversation_flow_state_machine.hpp"
#include "interruption/interruption_arbiter.hpp"
#include "session/session_memory_store.hpp"
#include "utils/json_utils.hpp"
#include "voice/voice_behavior_mapper.hpp"
#include <string>
#include <vector>

namespace affectrt {
namespace core {

/**
 * Pipeline-level limits
 */
struct PipelineConfig {
    size_t maxInputChars = 1000;
    size_t workerThreads = 2;
    std::string logLevel = "info";
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Every tunable of the engine. Defaults are the reference constants.
 */
struct EngineConfig {
    audio::AudioConfig audio;
    emotion::FusionConfig fusion;
    session::SessionConfig session;
    crisis::CrisisConfig crisis;
    flow::FlowConfig flow;
    interruption::InterruptionConfig interruption;
    voice::VoiceConfig voice;
    PipelineConfig pipeline;

    /**
     * Overlay the keys present in a flat JSON object onto the defaults.
     * Throws ConfigurationException on a non-object root or a wrongly typed key.
     */
    static EngineConfig fromJson(const utils::JsonValue& json);

    /**
     * Parse a JSON file. Unreadable files and malformed JSON throw
     * ConfigurationException.
     */
    static EngineConfig loadFromFile(const std::string& path);

    ConfigValidationResult validate() const;

    utils::JsonValue toJson() const;
};

} // namespace core
} // namespace affectrt

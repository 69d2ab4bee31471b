#include "core/engine_config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <set>
#include <stdexcept>

namespace affectrt {
namespace core {

namespace {

const std::set<std::string>& knownKeys() {
    static const std::set<std::string> keys = {
        "inactivityTimeoutMs", "minResponseDelayMs", "maxResponseDelayMs",
        "interruptionCountCap", "confidenceThreshold", "crisisLevelThresholds",
        "smoothingAlpha", "driftThreshold", "sweepIntervalMs", "crisisWeights",
        "engagementDecay", "initialEngagement", "interruptionEngagementThreshold",
        "pollIntervalMs", "micLevelThreshold", "maxInputChars", "workerThreads", "logLevel"};
    return keys;
}

const utils::JsonValue& objectProperty(const utils::JsonValue& json, const std::string& key) {
    const utils::JsonValue& value = json.getProperty(key);
    if (!value.isObject()) {
        throw std::invalid_argument("Expected an object for key: " + key);
    }
    return value;
}

utils::JsonValue number(double value) {
    return utils::JsonValue(value);
}

} // namespace

EngineConfig EngineConfig::fromJson(const utils::JsonValue& json) {
    if (!json.isObject()) {
        throw utils::ConfigurationException("Configuration root must be a JSON object");
    }

    EngineConfig config;
    try {
        for (const auto& entry : json.asObject()) {
            if (knownKeys().count(entry.first) == 0) {
                utils::Logger::warn("Ignoring unknown configuration key: " + entry.first);
            }
        }

        config.session.inactivityTimeoutMs = static_cast<int64_t>(
            json.getNumber("inactivityTimeoutMs", static_cast<double>(config.session.inactivityTimeoutMs)));
        config.session.sweepIntervalMs = static_cast<int64_t>(
            json.getNumber("sweepIntervalMs", static_cast<double>(config.session.sweepIntervalMs)));
        config.session.smoothingAlpha = static_cast<float>(
            json.getNumber("smoothingAlpha", config.session.smoothingAlpha));
        config.session.driftThreshold = static_cast<float>(
            json.getNumber("driftThreshold", config.session.driftThreshold));
        config.session.initialEngagement = static_cast<float>(
            json.getNumber("initialEngagement", config.session.initialEngagement));
        config.voice.driftThreshold = config.session.driftThreshold;

        config.flow.minResponseDelayMs = static_cast<int64_t>(
            json.getNumber("minResponseDelayMs", static_cast<double>(config.flow.minResponseDelayMs)));
        config.flow.maxResponseDelayMs = static_cast<int64_t>(
            json.getNumber("maxResponseDelayMs", static_cast<double>(config.flow.maxResponseDelayMs)));
        config.flow.interruptionCountCap = static_cast<uint32_t>(
            json.getNumber("interruptionCountCap", config.flow.interruptionCountCap));
        config.flow.engagementDecay = static_cast<float>(
            json.getNumber("engagementDecay", config.flow.engagementDecay));
        config.flow.interruptionEngagementThreshold = static_cast<float>(
            json.getNumber("interruptionEngagementThreshold", config.flow.interruptionEngagementThreshold));

        config.fusion.confidenceThreshold = static_cast<float>(
            json.getNumber("confidenceThreshold", config.fusion.confidenceThreshold));

        if (json.hasProperty("crisisLevelThresholds")) {
            const auto& thresholds = objectProperty(json, "crisisLevelThresholds");
            config.crisis.lowThreshold = static_cast<float>(thresholds.getNumber("low", config.crisis.lowThreshold));
            config.crisis.mediumThreshold = static_cast<float>(
                thresholds.getNumber("medium", config.crisis.mediumThreshold));
            config.crisis.highThreshold = static_cast<float>(thresholds.getNumber("high", config.crisis.highThreshold));
            config.crisis.criticalThreshold = static_cast<float>(
                thresholds.getNumber("critical", config.crisis.criticalThreshold));
        }
        if (json.hasProperty("crisisWeights")) {
            const auto& weights = objectProperty(json, "crisisWeights");
            config.crisis.textWeight = static_cast<float>(weights.getNumber("text", config.crisis.textWeight));
            config.crisis.voiceWeight = static_cast<float>(weights.getNumber("voice", config.crisis.voiceWeight));
            config.crisis.behavioralWeight = static_cast<float>(
                weights.getNumber("behavioral", config.crisis.behavioralWeight));
        }

        config.interruption.pollIntervalMs = static_cast<int64_t>(
            json.getNumber("pollIntervalMs", static_cast<double>(config.interruption.pollIntervalMs)));
        config.interruption.micLevelThreshold = static_cast<float>(
            json.getNumber("micLevelThreshold", config.interruption.micLevelThreshold));

        config.pipeline.maxInputChars = static_cast<size_t>(
            json.getNumber("maxInputChars", static_cast<double>(config.pipeline.maxInputChars)));
        config.pipeline.workerThreads = static_cast<size_t>(
            json.getNumber("workerThreads", static_cast<double>(config.pipeline.workerThreads)));
        config.pipeline.logLevel = json.getString("logLevel", config.pipeline.logLevel);
    } catch (const std::invalid_argument& e) {
        throw utils::ConfigurationException("Invalid configuration value", e.what());
    }
    return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
    utils::JsonValue json;
    try {
        json = utils::JsonParser::parseFile(path);
    } catch (const std::runtime_error& e) {
        throw utils::ConfigurationException("Failed to load configuration from " + path, e.what());
    }
    EngineConfig config = fromJson(json);
    utils::Logger::info("Engine configuration loaded from: " + path);
    return config;
}

ConfigValidationResult EngineConfig::validate() const {
    ConfigValidationResult result;

    if (session.inactivityTimeoutMs <= 0) {
        result.addError("inactivityTimeoutMs must be positive");
    } else if (session.inactivityTimeoutMs < 60 * 1000) {
        result.addWarning("inactivityTimeoutMs below one minute will expire live calls");
    }
    if (session.sweepIntervalMs <= 0) {
        result.addError("sweepIntervalMs must be positive");
    }
    if (!(session.smoothingAlpha > 0.0f && session.smoothingAlpha <= 1.0f)) {
        result.addError("smoothingAlpha must be in (0, 1]");
    }
    if (session.driftThreshold < 0.0f) {
        result.addError("driftThreshold must be non-negative");
    }
    if (session.initialEngagement < 0.0f || session.initialEngagement > 1.0f) {
        result.addError("initialEngagement must be between 0.0 and 1.0");
    }
    if (session.recentEmotionsCapacity == 0 || session.historyCapacity == 0 ||
        session.crisisHistoryCapacity == 0) {
        result.addError("Session ring buffer capacities must be positive");
    }

    if (flow.minResponseDelayMs < 0) {
        result.addError("minResponseDelayMs must be non-negative");
    }
    if (flow.minResponseDelayMs > flow.maxResponseDelayMs) {
        result.addError("minResponseDelayMs must not exceed maxResponseDelayMs");
    }
    if (flow.maxResponseDelayMs > 10000) {
        result.addWarning("maxResponseDelayMs above 10s makes the assistant feel unresponsive");
    }
    if (!(flow.engagementDecay > 0.0f && flow.engagementDecay <= 1.0f)) {
        result.addError("engagementDecay must be in (0, 1]");
    }
    if (flow.interruptionCountCap == 0) {
        result.addWarning("interruptionCountCap of 0 disables interruption admission");
    }

    if (fusion.confidenceThreshold < 0.0f || fusion.confidenceThreshold > 1.0f) {
        result.addError("confidenceThreshold must be between 0.0 and 1.0");
    } else if (fusion.confidenceThreshold < 0.3f || fusion.confidenceThreshold > 0.4f) {
        result.addWarning("confidenceThreshold outside the usual 0.3-0.4 range");
    }

    const float thresholds[] = {crisis.lowThreshold, crisis.mediumThreshold,
                                crisis.highThreshold, crisis.criticalThreshold};
    for (size_t i = 0; i < 4; ++i) {
        if (thresholds[i] < 0.0f || thresholds[i] > 1.0f) {
            result.addError("Crisis level thresholds must be between 0.0 and 1.0");
            break;
        }
        if (i > 0 && thresholds[i] <= thresholds[i - 1]) {
            result.addError("Crisis level thresholds must be strictly increasing");
            break;
        }
    }
    const float weightSum = crisis.textWeight + crisis.voiceWeight + crisis.behavioralWeight;
    if (std::fabs(weightSum - 1.0f) > 1e-3f) {
        result.addError("Crisis weights must sum to 1.0");
    }

    if (interruption.pollIntervalMs <= 0) {
        result.addError("pollIntervalMs must be positive");
    } else if (interruption.pollIntervalMs < 16 || interruption.pollIntervalMs > 100) {
        result.addWarning("pollIntervalMs outside the usual 16-100ms range");
    }
    if (interruption.micLevelThreshold < 0.0f || interruption.micLevelThreshold > 1.0f) {
        result.addError("micLevelThreshold must be between 0.0 and 1.0");
    }

    if (pipeline.maxInputChars == 0) {
        result.addError("maxInputChars must be positive");
    }
    if (pipeline.workerThreads == 0) {
        result.addError("workerThreads must be at least 1");
    }
    if (!audio.isValid()) {
        result.addError("Invalid audio sampler configuration");
    }

    return result;
}

utils::JsonValue EngineConfig::toJson() const {
    utils::JsonValue json;
    json.setObject();
    json.setObjectProperty("inactivityTimeoutMs", number(static_cast<double>(session.inactivityTimeoutMs)));
    json.setObjectProperty("sweepIntervalMs", number(static_cast<double>(session.sweepIntervalMs)));
    json.setObjectProperty("smoothingAlpha", number(session.smoothingAlpha));
    json.setObjectProperty("driftThreshold", number(session.driftThreshold));
    json.setObjectProperty("initialEngagement", number(session.initialEngagement));
    json.setObjectProperty("minResponseDelayMs", number(static_cast<double>(flow.minResponseDelayMs)));
    json.setObjectProperty("maxResponseDelayMs", number(static_cast<double>(flow.maxResponseDelayMs)));
    json.setObjectProperty("interruptionCountCap", number(flow.interruptionCountCap));
    json.setObjectProperty("engagementDecay", number(flow.engagementDecay));
    json.setObjectProperty("interruptionEngagementThreshold", number(flow.interruptionEngagementThreshold));
    json.setObjectProperty("confidenceThreshold", number(fusion.confidenceThreshold));

    utils::JsonValue thresholds;
    thresholds.setObject();
    thresholds.setObjectProperty("low", number(crisis.lowThreshold));
    thresholds.setObjectProperty("medium", number(crisis.mediumThreshold));
    thresholds.setObjectProperty("high", number(crisis.highThreshold));
    thresholds.setObjectProperty("critical", number(crisis.criticalThreshold));
    json.setObjectProperty("crisisLevelThresholds", thresholds);

    utils::JsonValue weights;
    weights.setObject();
    weights.setObjectProperty("text", number(crisis.textWeight));
    weights.setObjectProperty("voice", number(crisis.voiceWeight));
    weights.setObjectProperty("behavioral", number(crisis.behavioralWeight));
    json.setObjectProperty("crisisWeights", weights);

    json.setObjectProperty("pollIntervalMs", number(static_cast<double>(interruption.pollIntervalMs)));
    json.setObjectProperty("micLevelThreshold", number(interruption.micLevelThreshold));
    json.setObjectProperty("maxInputChars", number(static_cast<double>(pipeline.maxInputChars)));
    json.setObjectProperty("workerThreads", number(static_cast<double>(pipeline.workerThreads)));
    json.setObjectProperty("logLevel", utils::JsonValue(pipeline.logLevel));
    return json;
}

} // namespace core
} // namespace affectrt

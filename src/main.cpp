#include <iostream>
#include <string>
#include <memory>
#include "core/dialogue_pipeline.hpp"
#include "core/engine_config.hpp"
#include "core/scheduler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace affectrt;

namespace {

// Stand-in for the chat-completion service
class ScriptedGenerator : public core::TextGenerator {
public:
    std::string generate(const std::string& systemPrompt,
                         const std::vector<core::ConversationTurn>& history,
                         const std::string& latestUserText) override {
        (void)history;
        if (systemPrompt.find("crisis_level: critical") != std::string::npos) {
            return "I'm really glad you told me. You don't have to go through this alone. "
                   "Please reach out to a crisis line or emergency services right now.";
        }
        return "I hear you: \"" + latestUserText + "\". Tell me more.";
    }
};

void printResult(const core::TurnResult& result, const std::string& reply) {
    std::cout << "  emotion:  " << emotion::emotion_utils::toString(result.emotionalState.primaryEmotion);
    if (result.emotionalState.isBlended) {
        std::cout << " + " << emotion::emotion_utils::toString(result.emotionalState.secondaryEmotion);
    }
    std::cout << " (P " << result.emotionalState.pleasure << ", A " << result.emotionalState.arousal
              << ", D " << result.emotionalState.dominance << ")\n";
    std::cout << "  crisis:   " << crisis::crisis_utils::toString(result.crisis.level)
              << " / " << crisis::crisis_utils::toString(result.crisis.urgency)
              << (result.escalate ? " [ESCALATE]" : "") << "\n";
    std::cout << "  flow:     " << flow::flow_utils::toString(result.decision.action)
              << " " << result.decision.durationMs << "ms ("
              << flow::flow_utils::toString(result.decision.reason) << ")\n";
    std::cout << "  voice:    rate " << result.voiceParams.rateMultiplier
              << ", pitch " << result.voiceParams.pitchMultiplier
              << ", volume " << result.voiceParams.volumeMultiplier
              << ", style " << result.voiceParams.styleTag << "\n";
    if (!reply.empty()) {
        std::cout << "  reply:    " << reply << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Initialize logging
        utils::Logger::initialize();

        std::string configPath;
        std::string sessionId = "demo";
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--session" && i + 1 < argc) {
                sessionId = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --config <path>   Load engine configuration from a JSON file\n"
                          << "  --session <id>    Session id to use (default: demo)\n"
                          << "  --help, -h        Show this help message\n"
                          << "Type one utterance per line; an empty line ends the session.\n";
                return 0;
            }
        }

        core::EngineConfig config = configPath.empty() ? core::EngineConfig()
                                                       : core::EngineConfig::loadFromFile(configPath);
        utils::Logger::setLevel(utils::Logger::levelFromString(config.pipeline.logLevel));

        core::ThreadScheduler scheduler;
        scheduler.start();

        auto store = std::make_shared<session::SessionMemoryStore>(config.session);
        store->init(scheduler);
        store->setDriftCallback([](const std::string& id, float drift) {
            std::cout << "  (emotional drift " << drift << " in session " << id << ")\n";
        });

        core::DialogueEngine engine(config, store);
        engine.initialize();
        ScriptedGenerator generator;
        std::vector<core::ConversationTurn> history;

        std::cout << "affectrt demo, session '" << sessionId << "'" << std::endl;
        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            if (line.empty()) {
                break;
            }
            try {
                core::TurnResult result = engine.submitTurn(core::TurnInput{sessionId, line, std::nullopt}).get();

                // Let the processing pause elapse so the engine reaches its speak decision
                flow::FlowDecision decision = result.decision;
                if (decision.action == flow::FlowAction::PAUSE &&
                    decision.reason != flow::ReasonCode::CRISIS_HOLD) {
                    decision = engine.advance(sessionId, decision.durationMs);
                }

                std::string reply;
                if (decision.action == flow::FlowAction::SPEAK ||
                    decision.action == flow::FlowAction::INTERRUPT) {
                    reply = generator.generate(result.promptContext.render(), history, line);
                    history.push_back(core::ConversationTurn{"user", line});
                    history.push_back(core::ConversationTurn{"assistant", reply});
                    if (decision.action == flow::FlowAction::SPEAK) {
                        engine.completeResponse(sessionId);
                    }
                }
                result.decision = decision;
                printResult(result, reply);
            } catch (const utils::ValidationException& e) {
                std::cout << "  rejected: " << e.what() << std::endl;
            }
        }

        std::cout << "Shutting down..." << std::endl;
        engine.endSession(sessionId);
        engine.shutdown();
        store->shutdown();
        scheduler.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

// main.cpp
//
// Headless GraphFlow host. Parses the CLI (CLI11, optional config file),
// loads a JSON flow built from the built-in nodes and either updates its
// root nodes once under the flow's algorithm mode or plays it through a
// FlowPlayer until it finishes or is interrupted.
#include "Session.hpp"
#include "FlowSerializer.hpp"
#include "BuiltinNodes.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <thread>

using namespace GraphFlow;

// Global state
std::atomic<bool> running(true);

static void onSignal(int) {
    running.store(false);
}

static bool readFlowFile(const std::string& flowPath, nlohmann::json& json) {
    for (const std::string& prefix : {std::string(), std::string("../"), std::string("../../")}) {
        std::ifstream f(prefix + flowPath);
        if (f.good()) {
            f >> json;
            return true;
        }
    }
    return false;
}

static std::string flowTitleFor(const std::string& flowPath, const nlohmann::json& json) {
    if (json.contains("title") && json["title"].is_string() && !json["title"].get<std::string>().empty()) {
        return json["title"].get<std::string>();
    }
    auto slash = flowPath.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? flowPath : flowPath.substr(slash + 1);
    auto dot = base.rfind('.');
    if (dot != std::string::npos) base = base.substr(0, dot);
    return base.empty() ? "main" : base;
}

static void printProbes(const Flow& flow) {
    for (Node* n : flow.getNodes()) {
        if (auto* probe = dynamic_cast<ProbeNode*>(n)) {
            fmt::print("{} = {} ({} updates)\n", probe->getTitle(), valueToString(probe->getLastValue()),
                       probe->getCount());
        }
    }
}

int main(int argc, char** argv) {
    std::string flowPath = "flows/add.json";
    std::string mode;              // empty = keep the mode stored in the flow
    int fps = 30;
    bool play = false;
    bool dump = false;
    std::string logLevel = "info";

    CLI::App app{"GraphFlow"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file");
        app.add_option("--mode", mode, "Algorithm mode: manual|data|data-opt|exec")
            ->check(CLI::IsMember({"manual", "data", "data-opt", "exec"}));
        app.add_option("--fps", fps, "Player frame rate")->check(CLI::PositiveNumber);
        app.add_flag("--play", play, "Play the flow through a FlowPlayer");
        app.add_flag("--dump", dump, "Print the serialized flow after running");
        app.add_option("--log-level", logLevel, "Log level: debug|info|warn|error|off")
            ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }
    setLogLevel(parseLogLevel(logLevel).value_or(LogLevel::Info));

    nlohmann::json json;
    try {
        if (!readFlowFile(flowPath, json)) {
            fmt::print(stderr, "Could not find flow file: {}\n", flowPath);
            return 1;
        }
    } catch (const nlohmann::json::exception& e) {
        fmt::print(stderr, "Could not parse flow file {}: {}\n", flowPath, e.what());
        return 1;
    }

    Session session;
    registerBuiltinNodes(session.getNodeRegistry());
    const std::string title = flowTitleFor(flowPath, json);
    Flow* flow = session.createFlow(title);
    try {
        FlowSerializer(session.getNodeRegistry()).load(*flow, json);
        if (!mode.empty()) flow->setAlgorithmMode(mode);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to load flow '{}': {}\n", flowPath, e.what());
        return 1;
    }

    fmt::print("GraphFlow started. flow='{}', mode={}, nodes={}\n", flowPath, toString(flow->getAlgorithmMode()),
               flow->getNodes().size());

    if (play) {
        std::signal(SIGINT, onSignal);
        GraphPlayer* player = session.getPlayer(title);
        player->setFrames(fps);
        GraphActionResponse r = session.playFlow(title, true);
        if (r != GraphActionResponse::Success) {
            fmt::print(stderr, "Cannot play flow '{}': {}\n", title, toString(r));
            return 1;
        }
        while (player->getState() != GraphState::Stopped) {
            if (!running.load()) session.stopFlow(title);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        player->join();
        const GraphTime& t = player->getGraphTime();
        fmt::print("played {} frames in {:.3f}s (avg {:.1f} fps)\n", t.getFrameCount(), t.getTime(),
                   t.getAverageFps());
    } else {
        std::vector<Node*> nodes = flow->getNodes();
        try {
            for (Node* n : nodes) {
                if (!n->anyInputConnected()) n->update();
            }
        } catch (const FlowError& e) {
            fmt::print(stderr, "Execution failed: {}\n", e.what());
            return 1;
        }
    }

    printProbes(*flow);
    if (dump) {
        fmt::print("{}\n", FlowSerializer(session.getNodeRegistry()).serialize(*flow).dump(2));
    }
    session.shutdown();
    return 0;
}

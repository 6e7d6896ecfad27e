#include "Session.hpp"
#include "BuiltinNodes.hpp"
#include "TestNodes.hpp"
#include <gtest/gtest.h>

using namespace GraphFlow;
using namespace GraphFlow::test;

namespace {

// Player that completes a run immediately and counts its calls
class RecordingPlayer : public GraphPlayer {
public:
    using GraphPlayer::GraphPlayer;
    ~RecordingPlayer() override { join(); }

    GraphActionResponse play() override {
        if (!getFlow()) return GraphActionResponse::NoGraph;
        if (!transition(GraphState::Stopped, GraphState::Playing)) return GraphActionResponse::NotAllowed;
        ++plays;
        transition(GraphState::Playing, GraphState::Stopped);
        return GraphActionResponse::Success;
    }
    GraphActionResponse pause() override { return GraphActionResponse::NotAllowed; }
    GraphActionResponse resume() override { return GraphActionResponse::NotAllowed; }
    GraphActionResponse stop() override { return GraphActionResponse::NotAllowed; }

    int plays = 0;
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    SessionTest() { registerBuiltinNodes(session.getNodeRegistry()); }

    // ticker -> probe
    Flow& tickerFlow(const std::string& title, int frames) {
        Flow* flow = session.createFlow(title);
        auto& ticker = flow->createNode<TickerNode>("ticker");
        auto& probe = flow->createNode<ProbeNode>("probe");
        ticker.setFrames(frames);
        flow->connectNodes(ticker, 0, probe, 0);
        session.getPlayer(title)->setFrames(500);
        return *flow;
    }

    Session session;
};

TEST_F(SessionTest, FlowTitlesAreUniqueAndNonEmpty) {
    std::vector<std::string> created;
    session.flowCreated.sub([&](Flow& f) { created.push_back(f.getTitle()); });

    Flow* main = session.createFlow("main");
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(session.createFlow("main"), nullptr);
    EXPECT_EQ(session.createFlow(""), nullptr);
    Flow* other = session.createFlow("other");
    EXPECT_EQ(session.getFlows(), (std::vector<Flow*>{main, other}));
    EXPECT_EQ(session.getFlow("other"), other);
    EXPECT_EQ(created, (std::vector<std::string>{"main", "other"}));
    EXPECT_NE(session.getPlayer("main"), nullptr);
}

TEST_F(SessionTest, RenameKeepsTitlesUnique) {
    Flow* main = session.createFlow("main");
    session.createFlow("other");
    std::string renamedTo;
    session.flowRenamed.sub([&](Flow&, const std::string& title) { renamedTo = title; });

    EXPECT_FALSE(session.renameFlow(*main, "other"));
    EXPECT_FALSE(session.renameFlow(*main, ""));
    EXPECT_TRUE(session.renameFlow(*main, "renamed"));
    EXPECT_EQ(main->getTitle(), "renamed");
    EXPECT_EQ(renamedTo, "renamed");
    EXPECT_EQ(session.getFlow("main"), nullptr);
    EXPECT_NE(session.getPlayer("renamed"), nullptr);
}

TEST_F(SessionTest, DeleteRemovesFlowAndPlayer) {
    Flow* main = session.createFlow("main");
    std::string deleted;
    session.flowDeleted.sub([&](const std::string& title) { deleted = title; });

    EXPECT_TRUE(session.deleteFlow(*main));
    EXPECT_EQ(deleted, "main");
    EXPECT_EQ(session.getFlow("main"), nullptr);
    EXPECT_EQ(session.getPlayer("main"), nullptr);
    EXPECT_EQ(session.playFlow("main"), GraphActionResponse::NoGraph);
    EXPECT_TRUE(session.newFlowTitleValid("main"));
}

TEST_F(SessionTest, UnknownTitleHasNoGraph) {
    EXPECT_EQ(session.playFlow("missing"), GraphActionResponse::NoGraph);
    EXPECT_EQ(session.pauseFlow("missing"), GraphActionResponse::NoGraph);
    EXPECT_EQ(session.resumeFlow("missing"), GraphActionResponse::NoGraph);
    EXPECT_EQ(session.stopFlow("missing"), GraphActionResponse::NoGraph);
}

TEST_F(SessionTest, PlaysFlowToCompletion) {
    Flow& flow = tickerFlow("ticks", 3);
    auto* probe = dynamic_cast<ProbeNode*>(flow.getNodes()[1]);

    EXPECT_EQ(session.pauseFlow("ticks"), GraphActionResponse::NotAllowed);
    EXPECT_EQ(session.stopFlow("ticks"), GraphActionResponse::NotAllowed);
    EXPECT_EQ(session.playFlow("ticks"), GraphActionResponse::Success);
    EXPECT_EQ(probe->getLastValue(), Value{3});
    EXPECT_EQ(session.getPlayer("ticks")->getGraphTime().getFrameCount(), 3u);
    EXPECT_EQ(session.getPlayer("ticks")->getState(), GraphState::Stopped);
}

TEST_F(SessionTest, AsyncPlayIsStoppedByShutdown) {
    tickerFlow("endless", 0);
    EXPECT_EQ(session.playFlow("endless", true), GraphActionResponse::Success);
    EXPECT_EQ(session.playFlow("endless", true), GraphActionResponse::NotAllowed);

    session.shutdown();
    EXPECT_EQ(session.getPlayer("endless")->getState(), GraphState::Stopped);
    EXPECT_EQ(session.resumeFlow("endless"), GraphActionResponse::NotAllowed);
}

TEST_F(SessionTest, CustomPlayerReplacesDefault) {
    session.createFlow("main");
    auto custom = std::make_unique<RecordingPlayer>();
    RecordingPlayer* ref = custom.get();

    EXPECT_FALSE(session.setPlayer("missing", std::make_unique<RecordingPlayer>()));
    EXPECT_TRUE(session.setPlayer("main", std::move(custom)));
    EXPECT_EQ(session.getPlayer("main"), ref);
    EXPECT_EQ(ref->getFlow(), session.getFlow("main"));
    EXPECT_EQ(session.playFlow("main"), GraphActionResponse::Success);
    EXPECT_EQ(session.playFlow("main", true), GraphActionResponse::Success);
    ref->join();
    EXPECT_EQ(ref->plays, 2);
}

TEST_F(SessionTest, SerializedFlowsLoadIntoAnotherSession) {
    Flow* sums = session.createFlow("sums");
    sums->setAlgorithmMode(FlowAlg::DataOpt);
    auto& a = sums->createNode<ValueNode>("a");
    auto& add = sums->createNode<AddNode>("add");
    sums->connectNodes(a, 0, add, 0);
    tickerFlow("ticks", 2);

    nlohmann::json saved = session.serialize();
    ASSERT_TRUE(saved["flows"].contains("sums"));
    ASSERT_TRUE(saved["flows"].contains("ticks"));

    Session restored;
    registerBuiltinNodes(restored.getNodeRegistry());
    auto loaded = restored.load(saved);
    ASSERT_EQ(loaded.size(), 2u);

    Flow* copy = restored.getFlow("sums");
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->getAlgorithmMode(), FlowAlg::DataOpt);
    EXPECT_EQ(copy->getConnectionTuples(), sums->getConnectionTuples());
    auto* ticker = dynamic_cast<TickerNode*>(restored.getFlow("ticks")->getNodes()[0]);
    ASSERT_NE(ticker, nullptr);
    EXPECT_EQ(ticker->getFrames(), 2);

    // titles already present are refused
    EXPECT_THROW(restored.load(saved), FlowError);
}

TEST_F(SessionTest, FailedLoadLeavesNoFlowBehind) {
    nlohmann::json data = nlohmann::json::parse(R"({
        "flows": {
            "good": { "nodes": [ { "identifier": "Value" } ] },
            "main": { "nodes": [ { "identifier": "Value" }, { "identifier": "Nope" } ] }
        }
    })");
    std::vector<std::string> deleted;
    session.flowDeleted.sub([&](const std::string& title) { deleted.push_back(title); });

    EXPECT_THROW(session.load(data), FlowError);
    EXPECT_EQ(session.getFlow("main"), nullptr);
    EXPECT_EQ(session.getFlow("good"), nullptr);
    EXPECT_TRUE(session.getFlows().empty());
    EXPECT_EQ(deleted.size(), 2u);

    // the titles are free for a corrected retry
    data["flows"]["main"]["nodes"][1]["identifier"] = "Probe";
    auto loaded = session.load(data);
    EXPECT_EQ(loaded.size(), 2u);
    ASSERT_NE(session.getFlow("main"), nullptr);
    EXPECT_EQ(session.getFlow("main")->getNodes().size(), 2u);
}

TEST_F(SessionTest, DeleteFromInsideItsOwnRunIsRefused) {
    Flow& flow = tickerFlow("self", 0);
    auto& watcher = flow.createNode<CallbackNode>("watcher", 1, 0);
    flow.connectNodes(*flow.getNodes()[0], 0, watcher, 0);

    bool deletedDuringRun = true;
    watcher.callback = [&](CallbackNode&, int) { deletedDuringRun = session.deleteFlow(flow); };

    // the refused delete still requested the stop, so the run ends after one frame
    EXPECT_EQ(session.playFlow("self"), GraphActionResponse::Success);
    EXPECT_FALSE(deletedDuringRun);
    EXPECT_EQ(watcher.calls, 1);
    ASSERT_EQ(session.getFlow("self"), &flow);
    EXPECT_TRUE(session.deleteFlow(flow));
    EXPECT_EQ(session.getFlow("self"), nullptr);
}

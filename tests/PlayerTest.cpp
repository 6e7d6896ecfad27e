#include "GraphPlayer.hpp"
#include "Flow.hpp"
#include "FlowExecutor.hpp"
#include "BuiltinNodes.hpp"
#include "TestNodes.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

using namespace GraphFlow;
using namespace GraphFlow::test;

namespace {

// Polls `pred` until it holds or two seconds pass
template <typename Pred>
bool waitFor(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

class PlayerTest : public ::testing::Test {
protected:
    IdCounter ids;
    Flow flow{"player", ids};
};

// Frame node limited to 10 frames, stopped from a callback after 4 ticks
TEST_F(PlayerTest, StopIsHonouredAtNextTick) {
    auto& frames = flow.createNode<CountingFrameNode>("frames", 10);
    auto& sink = flow.createNode<CallbackNode>("sink", 1, 0);
    flow.connectNodes(frames, 0, sink, 0);

    FlowPlayer player(&flow, 200);
    std::vector<Value> received;
    sink.callback = [&](CallbackNode& self, int inp) {
        received.push_back(self.input(inp));
        if (self.input(inp) == Value{4}) EXPECT_EQ(player.stop(), GraphActionResponse::Success);
    };

    EXPECT_EQ(player.play(), GraphActionResponse::Success);
    EXPECT_EQ(player.getState(), GraphState::Stopped);
    EXPECT_EQ(player.getGraphTime().getFrameCount(), 4u);
    EXPECT_EQ(frames.ticks, 4);
    EXPECT_EQ(received, (std::vector<Value>{Value{1}, Value{2}, Value{3}, Value{4}}));
    EXPECT_EQ(frames.inits, 1);
    EXPECT_EQ(frames.stops.load(), 1);
    EXPECT_EQ(player.stop(), GraphActionResponse::NotAllowed);
}

TEST_F(PlayerTest, RunEndsWhenAllFrameNodesFinish) {
    auto& frames = flow.createNode<CountingFrameNode>("frames", 3);
    auto& sink = flow.createNode<SinkNode>("sink");
    flow.connectNodes(frames, 0, sink, 0);

    FlowPlayer player(&flow, 500);
    EXPECT_EQ(player.play(), GraphActionResponse::Success);
    EXPECT_EQ(player.getGraphTime().getFrameCount(), 3u);
    EXPECT_EQ(sink.calls(), 3);
    EXPECT_TRUE(frames.isFinished());
}

// 5 + 7 = 12 in a single pass, with the flow's executor restored afterwards
TEST_F(PlayerTest, SinglePassWithoutFrameNodes) {
    flow.setAlgorithmMode(FlowAlg::DataOpt);
    auto& a = flow.createNode<ValueNode>("a");
    auto& b = flow.createNode<ValueNode>("b");
    auto& add = flow.createNode<AddNode>("add");
    auto& probe = flow.createNode<ProbeNode>("probe");
    auto& lonely = flow.createNode<SinkNode>("lonely");
    a.setState({{"value", 5}});
    b.setState({{"value", 7}});
    flow.connectNodes(a, 0, add, 0);
    flow.connectNodes(b, 0, add, 1);
    flow.connectNodes(add, 0, probe, 0);

    FlowPlayer player(&flow);
    EXPECT_EQ(player.play(), GraphActionResponse::Success);
    EXPECT_EQ(player.getState(), GraphState::Stopped);
    EXPECT_EQ(probe.getLastValue(), Value{12});
    EXPECT_EQ(probe.getCount(), 1);
    EXPECT_EQ(lonely.calls(), 0);
    EXPECT_EQ(player.getActiveNodes().size(), 4u);
    EXPECT_EQ(player.getRootNodes(), (std::vector<Node*>{&a, &b}));
    EXPECT_EQ(flow.getAlgorithmMode(), FlowAlg::DataOpt);
    EXPECT_EQ(player.getGraphTime().getFrameCount(), 0u);
}

TEST_F(PlayerTest, IllegalTransitionsFromInsideAPass) {
    auto& src = flow.createNode<SourceNode>("src");
    auto& cb = flow.createNode<CallbackNode>("cb", 1, 0);
    flow.connectNodes(src, 0, cb, 0);

    FlowPlayer player(&flow);
    GraphActionResponse replay = GraphActionResponse::Success;
    GraphActionResponse pause = GraphActionResponse::Success;
    GraphState stateDuringPass = GraphState::Stopped;
    bool framesLocked = false;
    cb.callback = [&](CallbackNode&, int) {
        replay = player.play();
        pause = player.pause();
        stateDuringPass = player.getState();
        framesLocked = !player.setFrames(60);
    };

    EXPECT_EQ(player.play(), GraphActionResponse::Success);
    EXPECT_EQ(cb.calls, 1);
    EXPECT_EQ(replay, GraphActionResponse::NotAllowed);
    // no frame-driven nodes: pause is refused and the state does not move
    EXPECT_EQ(pause, GraphActionResponse::NotAllowed);
    EXPECT_EQ(stateDuringPass, GraphState::Playing);
    EXPECT_TRUE(framesLocked);
    EXPECT_EQ(player.resume(), GraphActionResponse::NotAllowed);
}

TEST_F(PlayerTest, TopologyIsLockedDuringAPass) {
    auto& src = flow.createNode<SourceNode>("src");
    auto& cb = flow.createNode<CallbackNode>("cb", 1, 1);
    auto& other = flow.createNode<PassNode>("other");
    flow.connectNodes(src, 0, cb, 0);

    ConnValidType during = ConnValidType::Valid;
    cb.callback = [&](CallbackNode&, int) { during = flow.connectNodes(cb, 0, other, 0); };

    FlowPlayer player(&flow);
    player.play();
    EXPECT_EQ(during, ConnValidType::ExecutionInProgress);
    EXPECT_EQ(flow.connectNodes(cb, 0, other, 0), ConnValidType::Valid);
}

TEST_F(PlayerTest, PlayWithoutFlow) {
    FlowPlayer player;
    EXPECT_EQ(player.play(), GraphActionResponse::NoGraph);
    EXPECT_EQ(player.playAsync(), GraphActionResponse::NoGraph);
    EXPECT_TRUE(player.setFlow(&flow));
    EXPECT_EQ(player.getFlow(), &flow);
}

TEST_F(PlayerTest, AsyncPauseResumeStop) {
    auto& frames = flow.createNode<CountingFrameNode>("frames");
    auto& sink = flow.createNode<SinkNode>("sink");
    flow.connectNodes(frames, 0, sink, 0);

    FlowPlayer player(&flow, 200);
    std::vector<std::pair<GraphState, GraphState>> transitions;
    std::mutex transitionsMutex;
    player.getEvents().subStateChanged([&](const GraphStateEvent& ev) {
        std::lock_guard<std::mutex> lock(transitionsMutex);
        transitions.emplace_back(ev.oldState, ev.newState);
    });

    ASSERT_EQ(player.playAsync(), GraphActionResponse::Success);
    EXPECT_EQ(player.playAsync(), GraphActionResponse::NotAllowed);
    ASSERT_TRUE(waitFor([&] { return player.getGraphTime().getFrameCount() >= 2; }));

    EXPECT_EQ(player.pause(), GraphActionResponse::Success);
    EXPECT_EQ(player.getState(), GraphState::Paused);
    EXPECT_EQ(player.pause(), GraphActionResponse::NotAllowed);
    ASSERT_TRUE(waitFor([&] { return frames.pauses.load() == 1; }));
    auto pausedAt = player.getGraphTime().getFrameCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(player.getGraphTime().getFrameCount(), pausedAt);

    EXPECT_EQ(player.resume(), GraphActionResponse::Success);
    ASSERT_TRUE(waitFor([&] { return player.getGraphTime().getFrameCount() > pausedAt; }));
    EXPECT_EQ(player.stop(), GraphActionResponse::Success);
    player.join();

    EXPECT_EQ(player.getState(), GraphState::Stopped);
    EXPECT_EQ(frames.stops.load(), 1);
    EXPECT_EQ(frames.pauses.load(), 1);
    EXPECT_GT(player.getGraphTime().getTime(), 0.0);
    EXPECT_EQ(flow.getAlgorithmMode(), FlowAlg::Data);

    std::lock_guard<std::mutex> lock(transitionsMutex);
    using T = std::pair<GraphState, GraphState>;
    EXPECT_EQ(transitions, (std::vector<T>{{GraphState::Stopped, GraphState::Playing},
                                            {GraphState::Playing, GraphState::Paused},
                                            {GraphState::Paused, GraphState::Playing},
                                            {GraphState::Playing, GraphState::Stopped}}));
}

// lead -> follower -> sink, both frame nodes ticking for 3 frames
TEST_F(PlayerTest, ChainedFrameNodesPassDataEachTick) {
    auto& lead = flow.createNode<CountingFrameNode>("lead", 3);
    auto& follower = flow.createNode<FollowerFrameNode>("follower", 3);
    auto& sink = flow.createNode<SinkNode>("sink");
    flow.connectNodes(lead, 0, follower, 0);
    flow.connectNodes(follower, 0, sink, 0);

    FlowPlayer player(&flow, 500);
    EXPECT_EQ(player.play(), GraphActionResponse::Success);
    EXPECT_EQ(player.getGraphTime().getFrameCount(), 3u);
    EXPECT_EQ(follower.received, (std::vector<Value>{Value{1}, Value{2}, Value{3}}));
    EXPECT_EQ(sink.calls(), 3);
    EXPECT_EQ(sink.triggers, (std::vector<int>{0, 0, 0}));
}

TEST_F(PlayerTest, ExecutorIsClaimedForTheWholeRun) {
    auto& frames = flow.createNode<CountingFrameNode>("frames");
    auto& sink = flow.createNode<SinkNode>("sink");
    flow.connectNodes(frames, 0, sink, 0);

    FlowPlayer player(&flow, 200);
    ASSERT_EQ(player.playAsync(), GraphActionResponse::Success);
    ASSERT_TRUE(waitFor([&] { return player.getGraphTime().getFrameCount() >= 2; }));

    EXPECT_TRUE(flow.isExecutorClaimed());
    EXPECT_EQ(flow.getAlgorithmMode(), FlowAlg::Manual);
    EXPECT_THROW(flow.setAlgorithmMode(FlowAlg::DataOpt), FlowError);
    EXPECT_THROW(flow.setAlgorithmMode(FlowAlg::Manual), FlowError);
    EXPECT_THROW(flow.setExecutor(std::make_shared<DataFlowNaive>(flow)), FlowError);

    EXPECT_EQ(player.stop(), GraphActionResponse::Success);
    player.join();
    EXPECT_FALSE(flow.isExecutorClaimed());
    EXPECT_EQ(flow.getAlgorithmMode(), FlowAlg::Data);
    EXPECT_TRUE(flow.setAlgorithmMode(FlowAlg::DataOpt));
}

// Connects and disconnects from the test thread while the worker runs passes
TEST_F(PlayerTest, TopologyChangesFromAnotherThreadWaitForThePass) {
    auto& frames = flow.createNode<CountingFrameNode>("frames");
    auto& sink = flow.createNode<SinkNode>("sink");
    auto& extra = flow.createNode<SinkNode>("extra");
    flow.connectNodes(frames, 0, sink, 0);

    FlowPlayer player(&flow, 1000);
    ASSERT_EQ(player.playAsync(), GraphActionResponse::Success);
    ASSERT_TRUE(waitFor([&] { return player.getGraphTime().getFrameCount() >= 1; }));

    for (int i = 0; i < 200; ++i) {
        ASSERT_EQ(flow.connectNodes(frames, 0, extra, 0), ConnValidType::Valid);
        ASSERT_EQ(flow.disconnectNodes(frames, 0, extra, 0), ConnValidType::Valid);
    }
    EXPECT_FALSE(flow.isTopologyLocked());

    player.stop();
    player.join();
    EXPECT_GT(sink.calls(), 0);
    // not part of the run: gathered before it was connected
    EXPECT_EQ(extra.calls(), 0);
}

TEST_F(PlayerTest, OneOffStateSubscriberFiresOnce) {
    auto& src = flow.createNode<SourceNode>("src");
    auto& sink = flow.createNode<SinkNode>("sink");
    flow.connectNodes(src, 0, sink, 0);

    FlowPlayer player(&flow);
    int stopsSeen = 0;
    int playsSeen = 0;
    player.getEvents().subEvent(GraphState::Stopped, [&](const GraphStateEvent&) { ++stopsSeen; }, 0, true);
    player.getEvents().subEvent(GraphState::Playing, [&](const GraphStateEvent&) { ++playsSeen; });
    player.play();
    player.play();
    EXPECT_EQ(stopsSeen, 1);
    EXPECT_EQ(playsSeen, 2);
    EXPECT_EQ(sink.calls(), 2);
}

namespace {

// Player without a destructor of its own
class InstantPlayer : public GraphPlayer {
public:
    using GraphPlayer::GraphPlayer;

    GraphActionResponse play() override {
        if (!transition(GraphState::Stopped, GraphState::Playing)) return GraphActionResponse::NotAllowed;
        transition(GraphState::Playing, GraphState::Stopped);
        ++plays;
        return GraphActionResponse::Success;
    }
    GraphActionResponse pause() override { return GraphActionResponse::NotAllowed; }
    GraphActionResponse resume() override { return GraphActionResponse::NotAllowed; }
    GraphActionResponse stop() override { return GraphActionResponse::NotAllowed; }

    std::atomic<int> plays{0};
};

} // namespace

TEST_F(PlayerTest, BasePlayerJoinsItsWorkerOnDestruction) {
    auto player = std::make_unique<InstantPlayer>(&flow);
    ASSERT_EQ(player->playAsync(), GraphActionResponse::Success);
    ASSERT_TRUE(waitFor([&] { return player->plays.load() == 1; }));
    player.reset();
    SUCCEED();
}

TEST(GraphTimeTest, TracksFramesAndRates) {
    GraphTime time;
    EXPECT_EQ(time.getFrames(), 30);
    EXPECT_DOUBLE_EQ(time.getFrameDuration(), 1.0 / 30);
    EXPECT_THROW(time.setFrames(0), std::invalid_argument);

    time.advanceFrame();
    time.setDeltaTime(0.5);
    time.advanceFrame();
    time.setDeltaTime(0.25);
    EXPECT_EQ(time.getFrameCount(), 2u);
    EXPECT_DOUBLE_EQ(time.getTime(), 0.75);
    EXPECT_DOUBLE_EQ(time.getDeltaTime(), 0.25);
    EXPECT_DOUBLE_EQ(time.getCurrentFps(), 4.0);
    EXPECT_DOUBLE_EQ(time.getAverageFps(), 3.0);

    time.reset();
    EXPECT_EQ(time.getFrameCount(), 0u);
    EXPECT_DOUBLE_EQ(time.getAverageFps(), 0.0);
    EXPECT_EQ(time.getFrames(), 30);
}

TEST(GraphTimeTest, AverageUsesRollingWindow) {
    GraphTime time;
    for (size_t i = 0; i < GraphTime::FpsWindow; ++i) time.setDeltaTime(1.0);
    for (size_t i = 0; i < GraphTime::FpsWindow; ++i) time.setDeltaTime(0.5);
    EXPECT_DOUBLE_EQ(time.getAverageFps(), 2.0);
}

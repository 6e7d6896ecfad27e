// GraphPlayer.hpp
//
// Players drive a flow over time. A player owns a small state machine
//   Stopped --play--> Playing --pause--> Paused --resume--> Playing
//   Playing/Paused --stop--> Stopped (at the next tick boundary)
// plus a GraphTime clock and a GraphEvents hub that reports transitions.
//
// FlowPlayer is the default implementation: it installs its own ManualFlow
// executor for the duration of the run and schedules passes itself, ticking
// frame-driven nodes at the target frame rate.
#pragma once
#include "FlowTypes.hpp"
#include "Event.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace GraphFlow {

class Flow;
class Node;
class FlowExecutor;
class ManualFlow;

struct GraphStateEvent {
    GraphState oldState;
    GraphState newState;
};

// Transition notifications. Subscription and emission are serialized, so a
// player running on a worker thread can be observed from the caller.
class GraphEvents {
public:
    using Callback = std::function<void(const GraphStateEvent&)>;

    // Every transition
    SubscriptionId subStateChanged(Callback cb, int nice = 0, bool oneOff = false);
    bool unsubStateChanged(SubscriptionId id);
    // Transitions into `state` (Playing -> onPlay, Paused -> onPause, Stopped -> onStop)
    SubscriptionId subEvent(GraphState state, Callback cb, int nice = 0, bool oneOff = false);
    bool unsubEvent(GraphState state, SubscriptionId id);

    void invoke(const GraphStateEvent& ev);

private:
    Event<const GraphStateEvent&>& forState(GraphState state);

    std::recursive_mutex mutex;
    Event<const GraphStateEvent&> stateChanged;
    Event<const GraphStateEvent&> onPlay;
    Event<const GraphStateEvent&> onPause;
    Event<const GraphStateEvent&> onStop;
};

class GraphTime {
public:
    static constexpr size_t FpsWindow = 30;

    explicit GraphTime(int frames = 30);

    int getFrames() const;
    // Target frame rate; throws std::invalid_argument if not positive
    void setFrames(int frames);
    double getFrameDuration() const;

    std::uint64_t getFrameCount() const;
    double getTime() const;
    double getDeltaTime() const;
    double getCurrentFps() const;
    // Mean over the last FpsWindow frames
    double getAverageFps() const;

    void advanceFrame();
    // Records the duration of the last frame
    void setDeltaTime(double dt);
    // Clears counters; keeps the target frame rate
    void reset();

private:
    mutable std::mutex mutex;
    int frames;
    std::uint64_t frameCount = 0;
    double time = 0.0;
    double deltaTime = 0.0;
    double currentFps = 0.0;
    std::deque<double> fpsHistory;
    double fpsSum = 0.0;
};

class GraphPlayer {
public:
    explicit GraphPlayer(Flow* flow = nullptr, int frames = 30);
    // Joins a worker started by playAsync()
    virtual ~GraphPlayer();

    GraphPlayer(const GraphPlayer&) = delete;
    GraphPlayer& operator=(const GraphPlayer&) = delete;

    virtual GraphActionResponse play() = 0;
    virtual GraphActionResponse pause() = 0;
    virtual GraphActionResponse resume() = 0;
    virtual GraphActionResponse stop() = 0;
    // Runs play() on a worker thread owned by the player after checking the
    // state on the caller's thread. Implementations join in their destructor.
    virtual GraphActionResponse playAsync();
    // Waits for a playAsync() run
    virtual void join();

    GraphState getState() const { return state.load(); }
    Flow* getFlow() const { return flow; }
    // Only while stopped
    bool setFlow(Flow* f);
    // Only while stopped
    bool setFrames(int frames);

    GraphTime& getGraphTime() { return graphTime; }
    const GraphTime& getGraphTime() const { return graphTime; }
    GraphEvents& getEvents() { return events; }

protected:
    // Atomically moves `from` -> `to`; emits the transition on success
    bool transition(GraphState from, GraphState to);

    // Joins a finished worker; false if a run is still in flight or the
    // caller is the worker itself
    bool reapWorker();

    std::atomic<GraphState> state{GraphState::Stopped};
    Flow* flow;
    GraphTime graphTime;
    GraphEvents events;
    std::thread worker;
};

class FlowPlayer : public GraphPlayer {
public:
    using GraphPlayer::GraphPlayer;
    ~FlowPlayer() override;

    // Runs on the calling thread until the flow finishes or stop() is honoured
    GraphActionResponse play() override;
    // Same checks as play(), loop runs on the worker thread
    GraphActionResponse playAsync() override;
    // NotAllowed unless playing and the flow has frame-driven nodes
    GraphActionResponse pause() override;
    GraphActionResponse resume() override;
    // Requests termination; the player reaches Stopped at the next boundary
    GraphActionResponse stop() override;

    // Snapshot of the current (or last) run
    const std::vector<Node*>& getActiveNodes() const { return active; }
    const std::vector<Node*>& getRootNodes() const { return roots; }
    const std::vector<Node*>& getFrameNodes() const { return frameNodes; }

private:
    // Stopped -> Playing plus node gathering; NoGraph / NotAllowed otherwise
    GraphActionResponse begin();
    void gather();
    void run();
    void loop();
    void finish();
    // One pass from `passRoots`. Roots run with inp = -1 when invokeRoots is
    // set; frame nodes ticked just before the pass have already run.
    void runPass(const std::vector<Node*>& passRoots, bool invokeRoots);
    bool allFramesFinished() const;

    std::vector<Node*> active;
    std::vector<Node*> roots;
    std::vector<Node*> frameNodes;
    std::unordered_set<const Node*> activeSet;

    std::shared_ptr<ManualFlow> manual;
    std::shared_ptr<FlowExecutor> previousExecutor;
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> hasFrameNodes{false};
};

} // namespace GraphFlow

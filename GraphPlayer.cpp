// GraphPlayer.cpp
//
// Player state machine, graph clock and the default FlowPlayer loop.
#include "GraphPlayer.hpp"
#include "Flow.hpp"
#include "FlowExecutor.hpp"
#include "Log.hpp"
#include <unordered_map>

namespace GraphFlow {

// -- GraphEvents --

SubscriptionId GraphEvents::subStateChanged(Callback cb, int nice, bool oneOff) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return stateChanged.sub(std::move(cb), nice, oneOff);
}

bool GraphEvents::unsubStateChanged(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return stateChanged.unsub(id);
}

SubscriptionId GraphEvents::subEvent(GraphState state, Callback cb, int nice, bool oneOff) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return forState(state).sub(std::move(cb), nice, oneOff);
}

bool GraphEvents::unsubEvent(GraphState state, SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return forState(state).unsub(id);
}

void GraphEvents::invoke(const GraphStateEvent& ev) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    stateChanged.emit(ev);
    forState(ev.newState).emit(ev);
}

Event<const GraphStateEvent&>& GraphEvents::forState(GraphState state) {
    switch (state) {
        case GraphState::Playing: return onPlay;
        case GraphState::Paused: return onPause;
        case GraphState::Stopped: return onStop;
    }
    throw std::invalid_argument("Unknown graph state");
}

// -- GraphTime --

GraphTime::GraphTime(int f) : frames(f) {
    if (frames <= 0) throw std::invalid_argument("Frame rate must be positive");
}

int GraphTime::getFrames() const {
    std::lock_guard<std::mutex> lock(mutex);
    return frames;
}

void GraphTime::setFrames(int f) {
    if (f <= 0) throw std::invalid_argument("Frame rate must be positive");
    std::lock_guard<std::mutex> lock(mutex);
    frames = f;
}

double GraphTime::getFrameDuration() const {
    std::lock_guard<std::mutex> lock(mutex);
    return 1.0 / frames;
}

std::uint64_t GraphTime::getFrameCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return frameCount;
}

double GraphTime::getTime() const {
    std::lock_guard<std::mutex> lock(mutex);
    return time;
}

double GraphTime::getDeltaTime() const {
    std::lock_guard<std::mutex> lock(mutex);
    return deltaTime;
}

double GraphTime::getCurrentFps() const {
    std::lock_guard<std::mutex> lock(mutex);
    return currentFps;
}

double GraphTime::getAverageFps() const {
    std::lock_guard<std::mutex> lock(mutex);
    return fpsHistory.empty() ? 0.0 : fpsSum / static_cast<double>(fpsHistory.size());
}

void GraphTime::advanceFrame() {
    std::lock_guard<std::mutex> lock(mutex);
    ++frameCount;
}

void GraphTime::setDeltaTime(double dt) {
    std::lock_guard<std::mutex> lock(mutex);
    deltaTime = dt;
    time += dt;
    currentFps = dt > 0.0 ? 1.0 / dt : 0.0;
    fpsHistory.push_back(currentFps);
    fpsSum += currentFps;
    if (fpsHistory.size() > FpsWindow) {
        fpsSum -= fpsHistory.front();
        fpsHistory.pop_front();
    }
}

void GraphTime::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    frameCount = 0;
    time = 0.0;
    deltaTime = 0.0;
    currentFps = 0.0;
    fpsHistory.clear();
    fpsSum = 0.0;
}

// -- GraphPlayer --

GraphPlayer::GraphPlayer(Flow* f, int frames) : flow(f), graphTime(frames) {}

GraphPlayer::~GraphPlayer() {
    if (!worker.joinable()) return;
    // a player destroyed from its own run cannot wait for itself
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
}

bool GraphPlayer::setFlow(Flow* f) {
    if (getState() != GraphState::Stopped) return false;
    flow = f;
    return true;
}

bool GraphPlayer::setFrames(int frames) {
    if (getState() != GraphState::Stopped) return false;
    graphTime.setFrames(frames);
    return true;
}

GraphActionResponse GraphPlayer::playAsync() {
    if (!flow) return GraphActionResponse::NoGraph;
    if (getState() != GraphState::Stopped || !reapWorker()) return GraphActionResponse::NotAllowed;
    worker = std::thread([this] {
        try {
            GraphActionResponse r = play();
            if (r != GraphActionResponse::Success) logWarn("asynchronous play refused: {}", toString(r));
        } catch (const std::exception& e) {
            logError("player for '{}' aborted: {}", flow->getTitle(), e.what());
        }
    });
    return GraphActionResponse::Success;
}

void GraphPlayer::join() {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) worker.join();
}

bool GraphPlayer::reapWorker() {
    if (!worker.joinable()) return true;
    // a finished run still owns the thread object
    if (getState() != GraphState::Stopped || worker.get_id() == std::this_thread::get_id()) return false;
    worker.join();
    return true;
}

bool GraphPlayer::transition(GraphState from, GraphState to) {
    GraphState expected = from;
    if (!state.compare_exchange_strong(expected, to)) return false;
    logDebug("player: {} -> {}", toString(from), toString(to));
    events.invoke(GraphStateEvent{from, to});
    return true;
}

// -- FlowPlayer --

FlowPlayer::~FlowPlayer() {
    stopRequested.store(true);
    join();
}

GraphActionResponse FlowPlayer::play() {
    GraphActionResponse r = begin();
    if (r != GraphActionResponse::Success) return r;
    run();
    return r;
}

GraphActionResponse FlowPlayer::playAsync() {
    if (flow && !reapWorker()) return GraphActionResponse::NotAllowed;
    GraphActionResponse r = begin();
    if (r != GraphActionResponse::Success) return r;
    worker = std::thread([this] {
        try {
            run();
        } catch (const std::exception& e) {
            logError("player loop for '{}' aborted: {}", flow->getTitle(), e.what());
        }
    });
    return r;
}

GraphActionResponse FlowPlayer::pause() {
    if (getState() != GraphState::Playing || !hasFrameNodes.load()) return GraphActionResponse::NotAllowed;
    return transition(GraphState::Playing, GraphState::Paused) ? GraphActionResponse::Success
                                                               : GraphActionResponse::NotAllowed;
}

GraphActionResponse FlowPlayer::resume() {
    return transition(GraphState::Paused, GraphState::Playing) ? GraphActionResponse::Success
                                                               : GraphActionResponse::NotAllowed;
}

GraphActionResponse FlowPlayer::stop() {
    if (getState() == GraphState::Stopped) return GraphActionResponse::NotAllowed;
    stopRequested.store(true);
    return GraphActionResponse::Success;
}

GraphActionResponse FlowPlayer::begin() {
    if (!flow) return GraphActionResponse::NoGraph;
    GraphState expected = GraphState::Stopped;
    if (!state.compare_exchange_strong(expected, GraphState::Playing)) return GraphActionResponse::NotAllowed;

    try {
        stopRequested.store(false);
        graphTime.reset();
        gather();
        manual = std::make_shared<ManualFlow>(*flow);
        previousExecutor = flow->claimExecutor(manual);
    } catch (...) {
        previousExecutor.reset();
        state.store(GraphState::Stopped);
        throw;
    }

    logInfo("playing flow '{}' ({} active, {} roots, {} frame nodes, {} fps)", flow->getTitle(), active.size(),
            roots.size(), frameNodes.size(), graphTime.getFrames());
    events.invoke(GraphStateEvent{GraphState::Stopped, GraphState::Playing});
    return GraphActionResponse::Success;
}

void FlowPlayer::gather() {
    active.clear();
    roots.clear();
    frameNodes.clear();
    activeSet.clear();
    for (Node* n : flow->getNodes()) {
        bool frameDriven = n->isFrameDriven();
        if (!frameDriven && !n->anyInputConnected() && !n->anyOutputConnected()) continue;
        active.push_back(n);
        activeSet.insert(n);
        if (!n->anyInputConnected()) roots.push_back(n);
        if (frameDriven) frameNodes.push_back(n);
    }
    hasFrameNodes.store(!frameNodes.empty());
}

void FlowPlayer::run() {
    try {
        loop();
    } catch (...) {
        finish();
        throw;
    }
    finish();
}

void FlowPlayer::loop() {
    using clock = std::chrono::steady_clock;

    for (Node* n : active) {
        n->init();
        if (n->isFrameDriven()) n->clearFinished();
    }
    {
        Flow::ExecutionScope lock(*flow);
        manual->clearUpdates();
        runPass(roots, true);
    }
    if (frameNodes.empty()) return;

    auto last = clock::now();
    bool pauseHooksCalled = false;
    while (!stopRequested.load()) {
        if (getState() == GraphState::Paused) {
            if (!pauseHooksCalled) {
                for (Node* n : active) n->pause();
                pauseHooksCalled = true;
            }
            std::this_thread::sleep_for(std::chrono::duration<double>(graphTime.getFrameDuration()));
            last = clock::now();
            continue;
        }
        pauseHooksCalled = false;

        auto tickStart = clock::now();
        graphTime.advanceFrame();
        {
            Flow::ExecutionScope lock(*flow);
            manual->clearUpdates();
            std::vector<Node*> ticked;
            for (Node* n : frameNodes) {
                if (n->isFinished()) continue;
                n->frameUpdate();
                if (manual->hasUpdatedOutputs(*n)) ticked.push_back(n);
            }
            if (!ticked.empty()) runPass(ticked, false);
        }
        if (allFramesFinished()) {
            logDebug("all frame nodes of '{}' finished after {} frames", flow->getTitle(), graphTime.getFrameCount());
            break;
        }

        auto target = std::chrono::duration<double>(graphTime.getFrameDuration());
        auto elapsed = clock::now() - tickStart;
        if (elapsed < target) std::this_thread::sleep_for(target - elapsed);
        auto now = clock::now();
        graphTime.setDeltaTime(std::chrono::duration<double>(now - last).count());
        last = now;
    }
}

void FlowPlayer::runPass(const std::vector<Node*>& passRoots, bool invokeRoots) {
    std::unordered_set<const Node*> rootSet(passRoots.begin(), passRoots.end());
    std::vector<Node*> order(passRoots.begin(), passRoots.end());
    std::unordered_set<const Node*> seen(passRoots.begin(), passRoots.end());
    std::unordered_map<const Node*, std::vector<Node*>> successors;
    for (size_t head = 0; head < order.size(); ++head) {
        Node* n = order[head];
        auto& distinct = successors[n];
        std::unordered_set<const Node*> local;
        for (Node* s : flow->getNodeSuccessors(*n)) {
            if (!activeSet.count(s) || !local.insert(s).second) continue;
            distinct.push_back(s);
            if (seen.insert(s).second) order.push_back(s);
        }
    }

    std::unordered_map<const Node*, int> waiting;
    for (Node* n : order) waiting.emplace(n, 0);
    for (Node* n : order) {
        for (Node* s : successors[n]) ++waiting[s];
    }

    std::deque<Node*> ready;
    for (Node* n : order) {
        if (waiting[n] == 0) ready.push_back(n);
    }

    size_t processed = 0;
    while (!ready.empty()) {
        Node* n = ready.front();
        ready.pop_front();
        ++processed;

        if (invokeRoots && rootSet.count(n)) {
            n->update(-1);
        } else {
            // ticked roots fed by another frame node still take its data
            for (size_t i = 0; i < n->numInputs(); ++i) {
                if (manual->shouldInputUpdate(n->getInput(i))) {
                    n->update(static_cast<int>(i));
                    break;
                }
            }
        }

        for (Node* s : successors[n]) {
            if (--waiting[s] == 0) ready.push_back(s);
        }
    }

    if (processed != order.size()) {
        logWarn("player pass on '{}' skipped {} node(s) on a cycle", flow->getTitle(), order.size() - processed);
    }
}

bool FlowPlayer::allFramesFinished() const {
    for (Node* n : frameNodes) {
        if (!n->isFinished()) return false;
    }
    return true;
}

void FlowPlayer::finish() {
    for (Node* n : active) {
        try {
            n->stop();
        } catch (const std::exception& e) {
            logError("stop hook of '{}' failed: {}", n->getTitle(), e.what());
        }
    }
    if (previousExecutor) flow->releaseExecutor(std::move(previousExecutor));
    previousExecutor.reset();
    GraphState old = state.exchange(GraphState::Stopped);
    logInfo("stopped flow '{}' after {} frames", flow->getTitle(), graphTime.getFrameCount());
    events.invoke(GraphStateEvent{old, GraphState::Stopped});
}

} // namespace GraphFlow

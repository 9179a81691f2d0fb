// Flowmap - Animation Overlay Implementation

#include <flowmap/animation_overlay.h>
#include <flowmap/performance_monitor.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace flowmap {

AnimationOverlay::AnimationOverlay(HostMap& map, RunLoop& loop, const OverlayConfig& config,
                                   const PerformanceMonitor* monitor)
    : m_loop(loop)
    , m_monitor(monitor)
    , m_lowPerformanceStride(std::max(1, config.lowPerformanceFrameStride))
    , m_overlay(map, loop, config.overlay)
    , m_cameraSync(map, loop, [this](const ViewState& view) { m_overlay.pushViewState(view); })
    , m_batcher(loop, monitor) {
    m_batcher.configure(config.batch);

    for (const PulseLayerDef& def : config.pulses) {
        m_registry.addPulse(def);
        m_runners.push_back(std::make_unique<AnimationRunner>(
            def.id, m_loop,
            std::make_unique<PulseClock>(def.periodMs, def.minRadius, def.maxRadius, def.waveform)));
    }
    for (const FlowLayerDef& def : config.flows) {
        m_registry.addFlow(def);
        m_runners.push_back(std::make_unique<AnimationRunner>(
            def.id, m_loop, std::make_unique<TripClock>(def.loopLength())));
    }
    for (auto& runner : m_runners) {
        runner->onTick([this](const AnimationRunner&) { m_layersDirty = true; });
    }

    m_overlay.setLayerSource([this]() { return composeLayers(); });
    m_overlay.setVisibilityQuery([this]() { return anyVisible(); });
    m_overlay.onAttached([this](OverlayHandle) { m_cameraSync.connect(); });
    m_overlay.onDetached([this](OverlayHandle) { m_cameraSync.disconnect(); });

    m_frameEndObserver = m_loop.addFrameEndObserver([this](double) { onFrameEnd(); });
}

AnimationOverlay::~AnimationOverlay() {
    m_loop.removeFrameEndObserver(m_frameEndObserver);
    m_batcher.clear();
    for (auto& runner : m_runners) {
        runner->setVisible(false);
    }
    m_overlay.detach();
}

// -----------------------------------------------------------------------------
// Visibility

AnimationRunner& AnimationOverlay::runnerFor(const std::string& id) {
    for (auto& runner : m_runners) {
        if (runner->id() == id) return *runner;
    }
    throw std::runtime_error("Animation not found: " + id);
}

const AnimationRunner& AnimationOverlay::runner(const std::string& id) const {
    for (const auto& runner : m_runners) {
        if (runner->id() == id) return *runner;
    }
    throw std::runtime_error("Animation not found: " + id);
}

void AnimationOverlay::setVisible(const std::string& id, bool visible) {
    AnimationRunner& target = runnerFor(id);
    if (target.visible() == visible) return;

    // Cancels the clock's frame and resets it before anything else runs
    target.setVisible(visible);

    if (visible) {
        m_overlay.attach();
        refresh();
    } else if (!anyVisible()) {
        m_layersDirty = false;
        m_overlay.detach();
    } else {
        refresh();
    }
}

bool AnimationOverlay::isVisible(const std::string& id) const {
    return runner(id).visible();
}

bool AnimationOverlay::anyVisible() const {
    return std::any_of(m_runners.begin(), m_runners.end(),
                       [](const std::unique_ptr<AnimationRunner>& r) { return r->visible(); });
}

size_t AnimationOverlay::visibleCount() const {
    return static_cast<size_t>(std::count_if(m_runners.begin(), m_runners.end(),
                               [](const std::unique_ptr<AnimationRunner>& r) { return r->visible(); }));
}

size_t AnimationOverlay::activeClockCount() const {
    return static_cast<size_t>(std::count_if(m_runners.begin(), m_runners.end(),
                               [](const std::unique_ptr<AnimationRunner>& r) { return r->hasActiveClock(); }));
}

void AnimationOverlay::applyScene(const VisibilityFlags& flags) {
    for (const auto& [id, visible] : flags) {
        if (!m_registry.contains(id)) {
            std::cerr << "[AnimationOverlay] Scene references unknown animation '" << id << "'\n";
            continue;
        }
        const std::string target = id;
        const bool show = visible;
        m_batcher.enqueue([this, target, show]() { setVisible(target, show); }, show ? 0 : 1);
    }
}

// -----------------------------------------------------------------------------
// Data

size_t AnimationOverlay::setRouteGeometry(const std::string& flowId, const std::vector<LineGeometry>& lines) {
    const FlowLayerDef* def = m_registry.flow(flowId);
    if (!def) {
        throw std::runtime_error("Flow layer not found: " + flowId);
    }

    TripBuildResult result = buildTrips(lines, def->trips, flowId);
    std::cout << "[AnimationOverlay] Loaded " << result.trips.size() << " trip(s) for '" << flowId
              << "' from " << result.routes << " route(s)\n";
    const size_t skipped = result.skipped;
    m_registry.setTrips(flowId, std::move(result.trips));

    if (runner(flowId).visible()) {
        refresh();
    }
    return skipped;
}

// -----------------------------------------------------------------------------
// Output

VisibilityFlags AnimationOverlay::visibility() const {
    VisibilityFlags flags;
    for (const auto& runner : m_runners) {
        flags[runner->id()] = runner->visible();
    }
    return flags;
}

ClockStates AnimationOverlay::clockStates() const {
    ClockStates states;
    for (const auto& runner : m_runners) {
        if (runner->visible() && runner->clock().started()) {
            states[runner->id()] = runner->clock().output();
        }
    }
    return states;
}

std::vector<AnimatedLayerSpec> AnimationOverlay::composeLayers() const {
    return m_registry.compose(visibility(), clockStates());
}

void AnimationOverlay::refresh() {
    m_layersDirty = false;
    m_overlay.update(composeLayers());
}

void AnimationOverlay::onFrameEnd() {
    if (!m_layersDirty) return;

    if (!m_overlay.isAttached()) {
        // The next attach composes from the layer source
        m_layersDirty = false;
        return;
    }

    if (m_monitor && m_monitor->isLowPerformance()) {
        ++m_lowPerformanceFrames;
        if (m_lowPerformanceFrames % static_cast<uint64_t>(m_lowPerformanceStride) != 0) {
            ++m_deferredFrames;
            return;
        }
    } else {
        m_lowPerformanceFrames = 0;
    }

    refresh();
    ++m_frameUpdates;
}

// -----------------------------------------------------------------------------
// Lifecycle

void AnimationOverlay::onCleanup(OverlayManager::CleanupCallback callback) {
    m_overlay.onCleanup(std::move(callback));
}

void AnimationOverlay::shutdown() {
    m_batcher.clear();
    for (auto& runner : m_runners) {
        runner->setVisible(false);
    }
    m_layersDirty = false;
    m_overlay.shutdown();
}

} // namespace flowmap

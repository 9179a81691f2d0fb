// Flowmap - Layer Registry Implementation

#include <flowmap/layer_registry.h>

#include <stdexcept>

namespace flowmap {

LayerRegistry::LayerRegistry()
    : m_emptyTrips(std::make_shared<const std::vector<TripParticle>>()) {}

void LayerRegistry::checkNewId(const std::string& id) const {
    if (id.empty()) {
        throw std::runtime_error("Layer id must not be empty");
    }
    if (m_entries.count(id) > 0) {
        throw std::runtime_error("Layer already registered: " + id);
    }
}

void LayerRegistry::addPulse(const PulseLayerDef& def) {
    checkNewId(def.id);
    m_entries[def.id] = Entry{LayerKind::PulseCircle, m_pulses.size()};
    m_pulses.push_back(def);
    m_order.push_back(def.id);
}

void LayerRegistry::addFlow(const FlowLayerDef& def) {
    checkNewId(def.id);
    m_entries[def.id] = Entry{LayerKind::FlowTrips, m_flows.size()};
    m_flows.push_back(def);
    m_trips.push_back(m_emptyTrips);
    m_order.push_back(def.id);
}

void LayerRegistry::setTrips(const std::string& flowId, std::vector<TripParticle> trips) {
    auto it = m_entries.find(flowId);
    if (it == m_entries.end() || it->second.kind != LayerKind::FlowTrips) {
        throw std::runtime_error("Flow layer not found: " + flowId);
    }
    m_trips[it->second.index] = std::make_shared<const std::vector<TripParticle>>(std::move(trips));
}

TripList LayerRegistry::trips(const std::string& flowId) const {
    auto it = m_entries.find(flowId);
    if (it == m_entries.end() || it->second.kind != LayerKind::FlowTrips) {
        return m_emptyTrips;
    }
    return m_trips[it->second.index];
}

bool LayerRegistry::contains(const std::string& id) const {
    return m_entries.count(id) > 0;
}

LayerKind LayerRegistry::kindOf(const std::string& id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw std::runtime_error("Layer not found: " + id);
    }
    return it->second.kind;
}

const PulseLayerDef* LayerRegistry::pulse(const std::string& id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.kind != LayerKind::PulseCircle) return nullptr;
    return &m_pulses[it->second.index];
}

const FlowLayerDef* LayerRegistry::flow(const std::string& id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.kind != LayerKind::FlowTrips) return nullptr;
    return &m_flows[it->second.index];
}

std::vector<std::string> LayerRegistry::ids() const {
    return m_order;
}

std::vector<AnimatedLayerSpec> LayerRegistry::compose(const VisibilityFlags& visibility,
                                                      const ClockStates& clocks) const {
    std::vector<AnimatedLayerSpec> layers;

    for (const std::string& id : m_order) {
        auto vis = visibility.find(id);
        if (vis == visibility.end() || !vis->second) continue;

        const Entry& entry = m_entries.at(id);
        auto clock = clocks.find(id);

        AnimatedLayerSpec spec;
        spec.id = id;
        spec.kind = entry.kind;
        spec.visible = true;

        if (entry.kind == LayerKind::PulseCircle) {
            const PulseLayerDef& def = m_pulses[entry.index];
            PulseParams& p = spec.pulse;
            p.position = def.position;
            p.radius = clock != clocks.end() ? clock->second : def.minRadius;
            p.fillColor = def.fillColor;
            p.lineColor = def.lineColor;
            p.radiusMinPixels = def.radiusMinPixels;
            p.radiusMaxPixels = def.radiusMaxPixels;
            p.lineWidthMinPixels = def.lineWidthMinPixels;
            p.lineWidthMaxPixels = def.lineWidthMaxPixels;
            p.stroked = def.stroked;
        } else {
            // Emitted even without trips so the overlay exists before data arrives
            const FlowLayerDef& def = m_flows[entry.index];
            FlowParams& f = spec.flow;
            f.trips = m_trips[entry.index];
            f.currentTime = clock != clocks.end() ? clock->second : 0.0;
            f.loopLength = def.loopLength();
            f.trailLength = def.trips.trailLengthMs;
            f.color = def.trips.color;
            f.width = def.width;
            f.widthMinPixels = def.widthMinPixels;
            f.widthMaxPixels = def.widthMaxPixels;
            f.fadeTrail = def.fadeTrail;
            f.roundedCaps = def.roundedCaps;
        }

        layers.push_back(std::move(spec));
    }

    return layers;
}

} // namespace flowmap

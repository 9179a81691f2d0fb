#pragma once

/**
 * @file layer_registry.h
 * @brief Layer definitions and the per-frame layer composer
 *
 * The registry holds the static definition of every animated layer. compose()
 * is a pure function of the registry, the visibility flags and the current
 * clock outputs; it is evaluated every frame a visible clock ticks and on
 * every visibility change.
 *
 * @par Example
 * @code
 * LayerRegistry registry;
 * registry.addPulse(PulseLayerDef{"pulse", {-97.06, 36.12}});
 * registry.addFlow(FlowLayerDef{"flow"});
 *
 * auto layers = registry.compose({{"pulse", true}, {"flow", true}},
 *                                {{"pulse", 1250.0}, {"flow", 4200.0}});
 * @endcode
 */

#include <flowmap/animation_clock.h>
#include <flowmap/trips.h>
#include <flowmap/types.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace flowmap {

/**
 * @brief Kind of animated layer
 */
enum class LayerKind {
    PulseCircle,
    FlowTrips
};

inline const char* layerKindName(LayerKind kind) {
    return kind == LayerKind::PulseCircle ? "pulse-circle" : "flow-trips";
}

/// Visibility flag per animation id; missing ids are hidden
using VisibilityFlags = std::map<std::string, bool>;

/// Clock output per animation id (pulse radius or trip time)
using ClockStates = std::map<std::string, double>;

using TripList = std::shared_ptr<const std::vector<TripParticle>>;

/**
 * @brief Static definition of a pulsing circle
 */
struct PulseLayerDef {
    std::string id;
    LngLat position{0.0, 0.0};
    double periodMs = 3000.0;
    double minRadius = 500.0;    ///< Metres
    double maxRadius = 2000.0;   ///< Metres
    PulseWaveform waveform = PulseWaveform::Sine;
    Color fillColor{76, 175, 80, 120};
    Color lineColor{76, 175, 80, 200};
    float radiusMinPixels = 20.0f;
    float radiusMaxPixels = 1000.0f;
    float lineWidthMinPixels = 3.0f;
    float lineWidthMaxPixels = 6.0f;
    bool stroked = true;
};

/**
 * @brief Static definition of a flowing trips layer
 */
struct FlowLayerDef {
    std::string id;
    TripSettings trips;
    float width = 8.0f;
    float widthMinPixels = 4.0f;
    float widthMaxPixels = 10.0f;
    bool fadeTrail = true;
    bool roundedCaps = true;

    double loopLength() const { return trips.loopLength(); }
};

/**
 * @brief Per-frame parameters of a pulse layer
 */
struct PulseParams {
    LngLat position{0.0, 0.0};
    double radius = 0.0;
    Color fillColor{0, 0, 0, 0};
    Color lineColor{0, 0, 0, 0};
    float radiusMinPixels = 0.0f;
    float radiusMaxPixels = 0.0f;
    float lineWidthMinPixels = 0.0f;
    float lineWidthMaxPixels = 0.0f;
    bool stroked = false;
};

/**
 * @brief Per-frame parameters of a trips layer
 */
struct FlowParams {
    TripList trips;               ///< Shared trip data, never null (may be empty)
    double currentTime = 0.0;
    double loopLength = 0.0;
    double trailLength = 0.0;
    Color color{0, 0, 0, 0};
    float width = 0.0f;
    float widthMinPixels = 0.0f;
    float widthMaxPixels = 0.0f;
    bool fadeTrail = true;
    bool roundedCaps = true;
};

/**
 * @brief One layer as pushed to the overlay
 *
 * Only the parameter block matching kind is meaningful.
 */
struct AnimatedLayerSpec {
    std::string id;
    LayerKind kind = LayerKind::PulseCircle;
    bool visible = true;
    PulseParams pulse;
    FlowParams flow;

    /// @brief False for a trips layer whose route data has not arrived
    bool hasData() const {
        return kind == LayerKind::PulseCircle || (flow.trips && !flow.trips->empty());
    }
};

/**
 * @brief Registry of layer definitions and their composer
 */
class LayerRegistry {
public:
    LayerRegistry();

    /**
     * @brief Register a pulse layer
     * @throw std::runtime_error if the id is empty or already registered
     */
    void addPulse(const PulseLayerDef& def);

    /**
     * @brief Register a flow layer
     * @throw std::runtime_error if the id is empty or already registered
     */
    void addFlow(const FlowLayerDef& def);

    /**
     * @brief Replace the trip data of a flow layer
     * @throw std::runtime_error if id is not a registered flow layer
     */
    void setTrips(const std::string& flowId, std::vector<TripParticle> trips);

    /// @brief Trip data of a flow layer (empty list when none loaded)
    TripList trips(const std::string& flowId) const;

    bool contains(const std::string& id) const;
    LayerKind kindOf(const std::string& id) const;
    const PulseLayerDef* pulse(const std::string& id) const;
    const FlowLayerDef* flow(const std::string& id) const;

    /// @brief All layer ids in registration order
    std::vector<std::string> ids() const;
    size_t size() const { return m_order.size(); }

    /**
     * @brief Compose the ordered layer list
     * @param visibility Visibility per id
     * @param clocks Clock output per id; a missing entry means the clock has
     *               not ticked yet and the layer uses its initial phase
     * @return One spec per visible layer, in registration order
     */
    std::vector<AnimatedLayerSpec> compose(const VisibilityFlags& visibility,
                                           const ClockStates& clocks) const;

private:
    struct Entry {
        LayerKind kind;
        size_t index;
    };

    void checkNewId(const std::string& id) const;

    std::vector<std::string> m_order;
    std::map<std::string, Entry> m_entries;
    std::vector<PulseLayerDef> m_pulses;
    std::vector<FlowLayerDef> m_flows;
    std::vector<TripList> m_trips;   // Parallel to m_flows
    TripList m_emptyTrips;
};

} // namespace flowmap

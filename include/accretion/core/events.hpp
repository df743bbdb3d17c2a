/**
 * @file events.hpp
 * @brief Outbound simulation events and inbound intent events.
 *
 * The event log is the only record of what happened during a tick. It is
 * produced by the spawner, integrator and collision resolver, consumed once
 * by the mission and stats reducers, and exposed read-only to outside layers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "accretion/components/basic.hpp"
#include "accretion/core/body_class.hpp"
#include "accretion/math/vector_math.hpp"

/**
 * @enum EventType
 * @brief Typed outcome recorded in the event log
 */
enum class EventType {
    Spawned,   ///< body entered the registry
    Absorbed,  ///< bodyId absorbed otherId
    Collided,  ///< elastic contact between bodyId and otherId
    Died,      ///< bodyId is dead and will be purged at the end of the tick
    Evolved,   ///< bodyId changed class
    Reset      ///< the run state was replaced
};

std::string eventTypeName(EventType type);

/**
 * @struct SimEvent
 * @brief One entry of the event log. Fields not meaningful for a type stay at their defaults.
 */
struct SimEvent {
    EventType type = EventType::Spawned;
    BodyId bodyId = InvalidBodyId;
    BodyId otherId = InvalidBodyId;

    // Absorbed: mass/speed/class of the absorbed body. Collided: approach speed in speed.
    double mass = 0.0;
    double speed = 0.0;
    double impulse = 0.0;  ///< Collided only: magnitude of the normal impulse
    BodyClass bodyClass = BodyClass::Asteroid;
    BodyClass previousClass = BodyClass::Asteroid;  ///< Evolved only

    bool isHazard = false;
    HazardKind hazardKind = HazardKind::RogueStar;

    bool playerInvolved = false;  ///< Absorbed: the absorber is the player. Others: either body is.

    bool operator==(const SimEvent& other) const;
    bool operator!=(const SimEvent& other) const { return !(*this == other); }
};

/**
 * @struct EventLog
 * @brief Ordered events of one tick
 */
struct EventLog {
    std::uint64_t tick = 0;
    double dt = 0.0;
    std::vector<SimEvent> events;

    bool empty() const { return events.empty(); }
    void clear() { events.clear(); }
    void push(const SimEvent& e) { events.push_back(e); }

    bool operator==(const EventLog& other) const;
};

/**
 * @enum IntentType
 * @brief Requests from the controls layer, applied at the start of the next tick
 */
enum class IntentType {
    Reset,
    SpawnBurst,
    SpawnBody,
    PlayerThrust
};

/**
 * @struct IntentEvent
 * @brief Discrete player/tool intent.
 *
 * SpawnBurst uses center/radius/count/baseMass/speed.
 * SpawnBody uses center as position, velocity and baseMass; bodyRadius < 0 picks the class radius.
 * PlayerThrust uses direction and boost.
 */
struct IntentEvent {
    IntentType type = IntentType::Reset;

    Position center;
    double radius = 0.0;
    std::size_t count = 0;
    double baseMass = 0.0;
    double speed = 0.0;

    Vector velocity;
    double bodyRadius = -1.0;
    bool asPlayer = false;

    Vector direction;
    bool boost = false;

    static IntentEvent reset();
    static IntentEvent spawnBurst(const Position& center, double radius, std::size_t count,
                                  double baseMass, double speed);
    static IntentEvent spawnBody(const Position& pos, const Vector& vel, double mass,
                                 double radius = -1.0, bool asPlayer = false);
    static IntentEvent thrust(const Vector& direction, bool boost = false);
};
